#pragma once
#include <keyward/schema/primitives.hpp>
#include <keyward/schema/wallet_purpose.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace keyward::schema::key {

struct builder final {
  keyward::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const wallet_purpose_t& purpose);

  builder& hash(const std::string_view& str);
  builder& hash(const std::span<const uint8_t>& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace keyward::schema::key
