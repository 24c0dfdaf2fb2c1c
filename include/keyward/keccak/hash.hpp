#pragma once
#include <keyward/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace keyward::keccak {

/// Incremental Keccak-256 with the original 0x01 padding used by Ethereum.
/// This is not NIST SHA3-256.
class hasher final {
 public:
  hasher();

  hasher& update(const std::span<const uint8_t>& bytes);
  hasher& update(const std::string_view& str);
  keyward::schema::hash32_t finalize();

 private:
  static constexpr std::size_t kRate = 136;

  void absorb_block(const uint8_t* block);

  std::array<uint64_t, 25> state_{};
  std::array<uint8_t, kRate> buffer_{};
  std::size_t buffered_{0};
};

keyward::schema::hash32_t hash(const std::string_view& str);
keyward::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace keyward::keccak
