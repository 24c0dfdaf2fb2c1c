#pragma once

#include <keyward/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: key provider.
// Which custody backend holds the private key behind a signing key.
namespace keyward::schema {

enum class key_provider_t : uint8_t { local = 0, managed_hsm = 1 };

inline constexpr auto kKeyProviderMappings = std::array{
    enum_mapping_t<key_provider_t>{"local", key_provider_t::local},
    enum_mapping_t<key_provider_t>{"managed-hsm",
                                   key_provider_t::managed_hsm}};

template <>
inline std::optional<key_provider_t> try_from_string<key_provider_t>(
    const std::string_view value) {
  return from_string(value, kKeyProviderMappings);
}

inline constexpr std::string_view to_string(const key_provider_t value) {
  return to_string(value, kKeyProviderMappings).value_or("unknown");
}

// Schema type: chain family.
// Address and signature scheme family a signing key serves.
enum class chain_family_t : uint8_t { evm = 0 };

inline constexpr auto kChainFamilyMappings =
    std::array{enum_mapping_t<chain_family_t>{"evm", chain_family_t::evm}};

template <>
inline std::optional<chain_family_t> try_from_string<chain_family_t>(
    const std::string_view value) {
  return from_string(value, kChainFamilyMappings);
}

inline constexpr std::string_view to_string(const chain_family_t value) {
  return to_string(value, kChainFamilyMappings).value_or("unknown");
}

}  // namespace keyward::schema
