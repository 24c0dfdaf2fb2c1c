#pragma once

#include <keyward/schema/primitives.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace keyward::testing {

/// Master secret used by every local signer fixture.
inline constexpr auto kMasterKeyHex = std::string_view{
    "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"};

inline keyward::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = keyward::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Big-endian 32 byte scalar holding value.
inline std::array<uint8_t, 32> make_scalar(const uint64_t value) {
  auto out = std::array<uint8_t, 32>{};
  for (std::size_t i = 0; i < 8; ++i) {
    out[31 - i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace keyward::testing
