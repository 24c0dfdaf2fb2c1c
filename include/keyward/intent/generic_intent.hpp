#pragma once
#include <keyward/intent/eip712.hpp>
#include <keyward/schema/primitives.hpp>
#include <json/json.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::intent {

inline constexpr auto kAutomationDomainName =
    std::string_view{"Keyward Automation"};
inline constexpr auto kAutomationDomainVersion = std::string_view{"1"};

/// One-shot authorization for an automated action. Consumed once per
/// (signer, chain, nonce).
struct generic_intent_t final {
  std::string intent_type;
  keyward::schema::address_t signer{};
  keyward::schema::chain_id_t chain_id{};
  std::string nonce;
  std::optional<std::string> signed_at;
  std::optional<std::string> expires_at;
  // Type specific members, e.g. tokenAddress, spender and amount.
  Json::Value fields{Json::objectValue};
};

/// As presented by a caller. The intent is schema checked during
/// verification, so it stays raw here.
struct signed_generic_intent_t final {
  Json::Value intent;
  std::string signature;
};

struct intent_type_definition_t final {
  std::string intent_type;
  std::string primary_type;
  // Members after the common header.
  std::vector<eip712::field_t> fields;
};

/// Registered intent types, "test-wallet" and "erc20-approve".
const std::vector<intent_type_definition_t>& intent_type_definitions();

const intent_type_definition_t* find_intent_type(
    const std::string_view& intent_type);

/// Full struct list for one intent type, header members first.
eip712::struct_types_t make_intent_types(
    const intent_type_definition_t& definition);

Json::Value make_intent_domain(keyward::schema::chain_id_t chain_id);

/// Validates the common header and, for a registered type, its members.
/// Returns std::nullopt with error describing every violation.
std::optional<generic_intent_t> parse_generic_intent(const Json::Value& value,
                                                     std::string& error);

Json::Value to_json(const generic_intent_t& intent);

/// EIP-712 digest, std::nullopt for an unregistered type. Absent signedAt and
/// expiresAt are hashed as empty strings.
std::optional<keyward::schema::hash32_t> hash_generic_intent(
    const generic_intent_t& intent);

/// "2024-01-01T00:00:00Z", optional fraction and numeric offset.
std::optional<keyward::schema::timestamp_milliseconds_t> parse_iso8601(
    const std::string_view& text);

}  // namespace keyward::intent
