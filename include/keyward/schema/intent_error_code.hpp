#pragma once

#include <keyward/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: intent error code.
// Terminal rejection reasons for a presented intent.
namespace keyward::schema {

enum class intent_error_code_t : uint8_t {
  invalid_schema = 1,
  invalid_signature = 2,
  signer_mismatch = 3,
  nonce_used = 4,
  intent_expired = 5,
  unknown_intent_type = 6
};

inline constexpr auto kIntentErrorCodeMappings = std::array{
    enum_mapping_t<intent_error_code_t>{"INVALID_SCHEMA",
                                        intent_error_code_t::invalid_schema},
    enum_mapping_t<intent_error_code_t>{
        "INVALID_SIGNATURE", intent_error_code_t::invalid_signature},
    enum_mapping_t<intent_error_code_t>{"SIGNER_MISMATCH",
                                        intent_error_code_t::signer_mismatch},
    enum_mapping_t<intent_error_code_t>{"NONCE_USED",
                                        intent_error_code_t::nonce_used},
    enum_mapping_t<intent_error_code_t>{"INTENT_EXPIRED",
                                        intent_error_code_t::intent_expired},
    enum_mapping_t<intent_error_code_t>{
        "UNKNOWN_INTENT_TYPE", intent_error_code_t::unknown_intent_type}};

template <>
inline std::optional<intent_error_code_t> try_from_string<intent_error_code_t>(
    const std::string_view value) {
  return from_string(value, kIntentErrorCodeMappings);
}

inline constexpr std::string_view to_string(const intent_error_code_t value) {
  return to_string(value, kIntentErrorCodeMappings).value_or("UNKNOWN");
}

}  // namespace keyward::schema
