#pragma once
#include <keyward/intent/eip712.hpp>
#include <keyward/schema/primitives.hpp>
#include <json/json.h>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace keyward::intent {

inline constexpr auto kPermissionDomainName =
    std::string_view{"Keyward Permissions"};
inline constexpr auto kPermissionDomainVersion = std::string_view{"1"};

inline constexpr auto kNativeCurrencyType = std::string_view{"native"};
inline constexpr auto kErc20CurrencyType = std::string_view{"erc20"};
inline constexpr auto kContractCallEffectType =
    std::string_view{"contract-call"};

struct native_currency_t final {
  keyward::schema::chain_id_t chain_id{};
  std::string symbol;

  bool operator==(const native_currency_t&) const = default;
};

struct erc20_currency_t final {
  keyward::schema::chain_id_t chain_id{};
  keyward::schema::address_t token_address{};
  std::string symbol;

  bool operator==(const erc20_currency_t&) const = default;
};

using allowed_currency_t = std::variant<native_currency_t, erc20_currency_t>;

struct contract_call_effect_t final {
  keyward::schema::chain_id_t chain_id{};
  keyward::schema::address_t contract_address{};
  keyward::schema::selector_t selector{};

  bool operator==(const contract_call_effect_t&) const = default;
};

using allowed_effect_t = std::variant<contract_call_effect_t>;

struct strategy_t final {
  std::string strategy_type;
  Json::Value config{Json::objectValue};

  bool operator==(const strategy_t&) const = default;
};

/// Durable grant. Verified by signature on every presentation; no nonce and
/// no expiry.
struct permission_intent_t final {
  std::string id;
  std::string name;
  std::string description;
  std::vector<allowed_currency_t> allowed_currencies;
  std::vector<allowed_effect_t> allowed_effects;
  strategy_t strategy;

  bool operator==(const permission_intent_t&) const = default;
};

struct signed_permission_intent_t final {
  permission_intent_t intent;
  keyward::schema::address_t signer{};
  std::string signature;
};

// Fixed shape members signed in place of the variants. Absent members take
// the zero value, e.g. the zero address for a native currency.
struct flat_currency_t final {
  std::string currency_type;
  keyward::schema::chain_id_t chain_id{};
  keyward::schema::address_t token_address{};
  std::string symbol;

  bool operator==(const flat_currency_t&) const = default;
};

struct flat_effect_t final {
  std::string effect_type;
  keyward::schema::chain_id_t chain_id{};
  keyward::schema::address_t contract_address{};
  keyward::schema::selector_t selector{};

  bool operator==(const flat_effect_t&) const = default;
};

struct flat_permission_intent_t final {
  std::string id;
  std::string name;
  std::string description;
  std::vector<flat_currency_t> allowed_currencies;
  std::vector<flat_effect_t> allowed_effects;
  std::string strategy_type;
  keyward::schema::hash32_t strategy_config_hash{};

  bool operator==(const flat_permission_intent_t&) const = default;
};

flat_permission_intent_t flatten(const permission_intent_t& intent);

/// The config hash cannot be reversed, so the strategy config is supplied
/// and checked against it. std::nullopt on an unknown member type or a
/// config mismatch.
std::optional<permission_intent_t> unflatten(
    const flat_permission_intent_t& flat,
    const Json::Value& strategy_config);

eip712::struct_types_t make_permission_types();

Json::Value make_permission_domain();

Json::Value to_typed_message(const flat_permission_intent_t& flat);

keyward::schema::hash32_t hash_permission_intent(
    const flat_permission_intent_t& flat);

/// Parse the JSON shape used on the wire:
/// {"id", "name", "description", "allowedCurrencies": [{"currencyType",
/// "chainId", "address"?, "symbol"}], "allowedEffects": [{"effectType",
/// "chainId", "contractAddress", "selector"}], "strategy": {"strategyType",
/// "config"}}
std::optional<permission_intent_t> parse_permission_intent(
    const Json::Value& value,
    std::string& error);

/// Parse {"intent": {...}, "signer": "0x...", "signature": "0x..."}.
std::optional<signed_permission_intent_t> parse_signed_permission_intent(
    const Json::Value& value,
    std::string& error);

bool allows_currency(const permission_intent_t& intent,
                     keyward::schema::chain_id_t chain_id,
                     const std::optional<keyward::schema::address_t>& token);

bool allows_effect(const permission_intent_t& intent,
                   keyward::schema::chain_id_t chain_id,
                   const keyward::schema::address_t& contract,
                   const keyward::schema::selector_t& selector);

struct compliance_result_t final {
  bool compliant{false};
  std::string reason;
};

/// An ERC-20 approve is compliant when the token is an allowed currency and
/// approve on the token contract is an allowed effect. Permission intents do
/// not name spenders, so any spender passes.
compliance_result_t check_erc20_approve_compliance(
    const permission_intent_t& intent,
    keyward::schema::chain_id_t chain_id,
    const keyward::schema::address_t& token);

}  // namespace keyward::intent
