#pragma once
#include <keyward/schema/primitives.hpp>
#include <json/json.h>
#include <optional>
#include <string>
#include <string_view>

namespace keyward::intent {

/// Compact JSON with object keys sorted bytewise at every depth. Two values
/// with the same content always serialize to the same bytes.
std::string canonical_json(const Json::Value& value);

/// keccak(canonical_json(value))
keyward::schema::hash32_t canonical_json_hash(const Json::Value& value);

/// Strict parse of a complete JSON document.
std::optional<Json::Value> parse_json(const std::string_view& text,
                                      std::string& error);

}  // namespace keyward::intent
