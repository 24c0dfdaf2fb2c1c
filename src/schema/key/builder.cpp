#include <algorithm>
#include <iterator>
#include <keyward/blake3/hash.hpp>
#include <keyward/schema/key/builder.hpp>
#include <ranges>

using namespace keyward::schema;
using namespace keyward::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const wallet_purpose_t& purpose) {
  std::visit(overloaded{[this](const automation_purpose&) {
                          this->write(uint8_t{0});
                        },
                        [this](const strategy_purpose& arg) {
                          this->write(uint8_t{1});
                          this->hash(arg.strategy_id);
                        }},
             purpose);
  return *this;
}

builder& builder::hash(const std::string_view& str) {
  auto digest = keyward::blake3::hash(str);
  std::ranges::copy(digest, std::back_inserter(data));
  return *this;
}

builder& builder::hash(const std::span<const uint8_t>& bytes) {
  auto digest = keyward::blake3::hash(bytes);
  std::ranges::copy(digest, std::back_inserter(data));
  return *this;
}
