#pragma once
#include <keyward/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

// Storage key digests. Ethereum-facing digests use keyward::keccak.
namespace keyward::blake3 {

keyward::schema::hash32_t hash(const std::string_view& str);
keyward::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace keyward::blake3
