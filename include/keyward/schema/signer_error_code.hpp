#pragma once

#include <keyward/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: signer error code.
// Failures raised by signing backends, the wallet registry and the nonce
// allocator.
namespace keyward::schema {

enum class signer_error_code_t : uint8_t {
  configuration_error = 1,
  key_not_found = 2,
  signing_failed = 3,
  recovery_failed = 4,
  wallet_exists = 5,
  wallet_not_found = 6,
  no_wallet = 7,
  invalid_argument = 8,
  storage_unavailable = 9
};

inline constexpr auto kSignerErrorCodeMappings = std::array{
    enum_mapping_t<signer_error_code_t>{
        "CONFIGURATION_ERROR", signer_error_code_t::configuration_error},
    enum_mapping_t<signer_error_code_t>{"KEY_NOT_FOUND",
                                        signer_error_code_t::key_not_found},
    enum_mapping_t<signer_error_code_t>{"SIGNING_FAILED",
                                        signer_error_code_t::signing_failed},
    enum_mapping_t<signer_error_code_t>{"RECOVERY_FAILED",
                                        signer_error_code_t::recovery_failed},
    enum_mapping_t<signer_error_code_t>{"WALLET_EXISTS",
                                        signer_error_code_t::wallet_exists},
    enum_mapping_t<signer_error_code_t>{"WALLET_NOT_FOUND",
                                        signer_error_code_t::wallet_not_found},
    enum_mapping_t<signer_error_code_t>{"NO_WALLET",
                                        signer_error_code_t::no_wallet},
    enum_mapping_t<signer_error_code_t>{
        "INVALID_ARGUMENT", signer_error_code_t::invalid_argument},
    enum_mapping_t<signer_error_code_t>{
        "STORAGE_UNAVAILABLE", signer_error_code_t::storage_unavailable}};

template <>
inline std::optional<signer_error_code_t> try_from_string<signer_error_code_t>(
    const std::string_view value) {
  return from_string(value, kSignerErrorCodeMappings);
}

inline constexpr std::string_view to_string(const signer_error_code_t value) {
  return to_string(value, kSignerErrorCodeMappings).value_or("UNKNOWN");
}

}  // namespace keyward::schema
