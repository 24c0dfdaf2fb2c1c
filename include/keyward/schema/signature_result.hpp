#pragma once
#include <keyward/schema/primitives.hpp>
#include <algorithm>
#include <array>

// Schema type: signature result.
// v is 27/28 for raw digest signing.
namespace keyward::schema {

struct signature_result_t final {
  hash32_t r{};
  hash32_t s{};
  uint8_t v{};
  std::array<uint8_t, 65> signature{};  // r || s || v
};

inline signature_result_t make_signature_result(const hash32_t& r,
                                                const hash32_t& s,
                                                const uint8_t v) {
  auto result = signature_result_t{.r = r, .s = s, .v = v};
  std::copy(r.begin(), r.end(), result.signature.begin());
  std::copy(s.begin(), s.end(), result.signature.begin() + 32);
  result.signature[64] = v;
  return result;
}

}  // namespace keyward::schema
