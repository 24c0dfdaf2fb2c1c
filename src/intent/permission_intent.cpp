#include <keyward/evm/abi.hpp>
#include <keyward/intent/canonical_json.hpp>
#include <keyward/intent/permission_intent.hpp>

#include <algorithm>

namespace keyward::intent {

using namespace keyward::schema;

namespace {

std::string hex_string(const bytes_view_t& bytes) {
  return "0x" + to_hex(bytes);
}

std::optional<address_t> read_address(const Json::Value& value) {
  if (!value.isString() || !value.asString().starts_with("0x")) {
    return std::nullopt;
  }
  return try_make_address(value.asString());
}

std::optional<selector_t> read_selector(const Json::Value& value) {
  if (!value.isString() || !value.asString().starts_with("0x")) {
    return std::nullopt;
  }
  auto bytes = try_from_hex(value.asString());
  if (!bytes || bytes->size() != 4) {
    return std::nullopt;
  }
  auto selector = selector_t{};
  std::ranges::copy(*bytes, selector.begin());
  return selector;
}

std::optional<std::string> read_string(const Json::Value& value) {
  if (!value.isString()) {
    return std::nullopt;
  }
  return value.asString();
}

std::optional<chain_id_t> read_chain_id(const Json::Value& value) {
  if (!value.isUInt64() || value.asUInt64() == 0) {
    return std::nullopt;
  }
  return value.asUInt64();
}

std::optional<allowed_currency_t> parse_currency(const Json::Value& value,
                                                 std::string& error) {
  if (!value.isObject()) {
    error = "currency must be an object";
    return std::nullopt;
  }
  auto type = read_string(value["currencyType"]);
  auto chain_id = read_chain_id(value["chainId"]);
  auto symbol = read_string(value["symbol"]);
  if (!type || !chain_id || !symbol) {
    error = "currency requires currencyType, chainId and symbol";
    return std::nullopt;
  }
  if (*type == kNativeCurrencyType) {
    return native_currency_t{.chain_id = *chain_id, .symbol = *symbol};
  }
  if (*type == kErc20CurrencyType) {
    auto address = read_address(value["address"]);
    if (!address) {
      error = "erc20 currency requires a token address";
      return std::nullopt;
    }
    return erc20_currency_t{
        .chain_id = *chain_id, .token_address = *address, .symbol = *symbol};
  }
  error = "unknown currencyType " + *type;
  return std::nullopt;
}

std::optional<allowed_effect_t> parse_effect(const Json::Value& value,
                                             std::string& error) {
  if (!value.isObject()) {
    error = "effect must be an object";
    return std::nullopt;
  }
  auto type = read_string(value["effectType"]);
  if (!type || *type != kContractCallEffectType) {
    error = "unknown effectType";
    return std::nullopt;
  }
  auto chain_id = read_chain_id(value["chainId"]);
  auto contract = read_address(value["contractAddress"]);
  auto selector = read_selector(value["selector"]);
  if (!chain_id || !contract || !selector) {
    error = "contract-call effect requires chainId, contractAddress and a "
            "4 byte selector";
    return std::nullopt;
  }
  return contract_call_effect_t{.chain_id = *chain_id,
                                .contract_address = *contract,
                                .selector = *selector};
}

}  // namespace

flat_permission_intent_t flatten(const permission_intent_t& intent) {
  auto flat = flat_permission_intent_t{};
  flat.id = intent.id;
  flat.name = intent.name;
  flat.description = intent.description;

  for (const auto& currency : intent.allowed_currencies) {
    flat.allowed_currencies.push_back(std::visit(
        overloaded{[](const native_currency_t& arg) {
                     return flat_currency_t{
                         .currency_type = std::string{kNativeCurrencyType},
                         .chain_id = arg.chain_id,
                         .token_address = address_t{},
                         .symbol = arg.symbol};
                   },
                   [](const erc20_currency_t& arg) {
                     return flat_currency_t{
                         .currency_type = std::string{kErc20CurrencyType},
                         .chain_id = arg.chain_id,
                         .token_address = arg.token_address,
                         .symbol = arg.symbol};
                   }},
        currency));
  }

  for (const auto& effect : intent.allowed_effects) {
    flat.allowed_effects.push_back(std::visit(
        overloaded{[](const contract_call_effect_t& arg) {
          return flat_effect_t{
              .effect_type = std::string{kContractCallEffectType},
              .chain_id = arg.chain_id,
              .contract_address = arg.contract_address,
              .selector = arg.selector};
        }},
        effect));
  }

  flat.strategy_type = intent.strategy.strategy_type;
  flat.strategy_config_hash = canonical_json_hash(intent.strategy.config);
  return flat;
}

std::optional<permission_intent_t> unflatten(
    const flat_permission_intent_t& flat,
    const Json::Value& strategy_config) {
  if (canonical_json_hash(strategy_config) != flat.strategy_config_hash) {
    return std::nullopt;
  }

  auto intent = permission_intent_t{};
  intent.id = flat.id;
  intent.name = flat.name;
  intent.description = flat.description;

  for (const auto& currency : flat.allowed_currencies) {
    if (currency.currency_type == kNativeCurrencyType) {
      intent.allowed_currencies.push_back(native_currency_t{
          .chain_id = currency.chain_id, .symbol = currency.symbol});
    } else if (currency.currency_type == kErc20CurrencyType) {
      intent.allowed_currencies.push_back(
          erc20_currency_t{.chain_id = currency.chain_id,
                           .token_address = currency.token_address,
                           .symbol = currency.symbol});
    } else {
      return std::nullopt;
    }
  }

  for (const auto& effect : flat.allowed_effects) {
    if (effect.effect_type != kContractCallEffectType) {
      return std::nullopt;
    }
    intent.allowed_effects.push_back(
        contract_call_effect_t{.chain_id = effect.chain_id,
                               .contract_address = effect.contract_address,
                               .selector = effect.selector});
  }

  intent.strategy.strategy_type = flat.strategy_type;
  intent.strategy.config = strategy_config;
  return intent;
}

eip712::struct_types_t make_permission_types() {
  return {
      {"PermissionIntent",
       {{"id", "string"},
        {"name", "string"},
        {"description", "string"},
        {"allowedCurrencies", "AllowedCurrency[]"},
        {"allowedEffects", "AllowedEffect[]"},
        {"strategyType", "string"},
        {"strategyConfigHash", "bytes32"}}},
      {"AllowedCurrency",
       {{"currencyType", "string"},
        {"chainId", "uint256"},
        {"tokenAddress", "address"},
        {"symbol", "string"}}},
      {"AllowedEffect",
       {{"effectType", "string"},
        {"chainId", "uint256"},
        {"contractAddress", "address"},
        {"selector", "bytes4"}}}};
}

Json::Value make_permission_domain() {
  auto domain = Json::Value{Json::objectValue};
  domain["name"] = std::string{kPermissionDomainName};
  domain["version"] = std::string{kPermissionDomainVersion};
  return domain;
}

Json::Value to_typed_message(const flat_permission_intent_t& flat) {
  auto message = Json::Value{Json::objectValue};
  message["id"] = flat.id;
  message["name"] = flat.name;
  message["description"] = flat.description;

  auto currencies = Json::Value{Json::arrayValue};
  for (const auto& currency : flat.allowed_currencies) {
    auto item = Json::Value{Json::objectValue};
    item["currencyType"] = currency.currency_type;
    item["chainId"] = Json::UInt64{currency.chain_id};
    item["tokenAddress"] = to_address_string(currency.token_address);
    item["symbol"] = currency.symbol;
    currencies.append(item);
  }
  message["allowedCurrencies"] = currencies;

  auto effects = Json::Value{Json::arrayValue};
  for (const auto& effect : flat.allowed_effects) {
    auto item = Json::Value{Json::objectValue};
    item["effectType"] = effect.effect_type;
    item["chainId"] = Json::UInt64{effect.chain_id};
    item["contractAddress"] = to_address_string(effect.contract_address);
    item["selector"] = hex_string(effect.selector);
    effects.append(item);
  }
  message["allowedEffects"] = effects;

  message["strategyType"] = flat.strategy_type;
  message["strategyConfigHash"] = hex_string(flat.strategy_config_hash);
  return message;
}

hash32_t hash_permission_intent(const flat_permission_intent_t& flat) {
  return eip712::digest(make_permission_domain(), "PermissionIntent",
                        to_typed_message(flat), make_permission_types());
}

std::optional<permission_intent_t> parse_permission_intent(
    const Json::Value& value,
    std::string& error) {
  error.clear();
  if (!value.isObject()) {
    error = "permission intent must be an object";
    return std::nullopt;
  }

  auto intent = permission_intent_t{};
  auto id = read_string(value["id"]);
  auto name = read_string(value["name"]);
  auto description = read_string(value["description"]);
  if (!id || id->empty() || !name || !description) {
    error = "permission intent requires id, name and description";
    return std::nullopt;
  }
  intent.id = *id;
  intent.name = *name;
  intent.description = *description;

  const auto& currencies = value["allowedCurrencies"];
  const auto& effects = value["allowedEffects"];
  if (!currencies.isArray() || !effects.isArray()) {
    error = "allowedCurrencies and allowedEffects must be arrays";
    return std::nullopt;
  }
  for (const auto& item : currencies) {
    auto currency = parse_currency(item, error);
    if (!currency) {
      return std::nullopt;
    }
    intent.allowed_currencies.push_back(std::move(*currency));
  }
  for (const auto& item : effects) {
    auto effect = parse_effect(item, error);
    if (!effect) {
      return std::nullopt;
    }
    intent.allowed_effects.push_back(std::move(*effect));
  }

  const auto& strategy = value["strategy"];
  if (!strategy.isObject()) {
    error = "strategy must be an object";
    return std::nullopt;
  }
  auto strategy_type = read_string(strategy["strategyType"]);
  if (!strategy_type || strategy_type->empty()) {
    error = "strategy requires a strategyType";
    return std::nullopt;
  }
  intent.strategy.strategy_type = *strategy_type;
  if (strategy.isMember("config")) {
    intent.strategy.config = strategy["config"];
  }
  return intent;
}

std::optional<signed_permission_intent_t> parse_signed_permission_intent(
    const Json::Value& value,
    std::string& error) {
  if (!value.isObject()) {
    error = "signed permission intent must be an object";
    return std::nullopt;
  }
  auto intent = parse_permission_intent(value["intent"], error);
  if (!intent) {
    return std::nullopt;
  }
  auto signer = read_address(value["signer"]);
  auto signature = read_string(value["signature"]);
  if (!signer || !signature) {
    error = "signed permission intent requires signer and signature";
    return std::nullopt;
  }
  return signed_permission_intent_t{.intent = std::move(*intent),
                                    .signer = *signer,
                                    .signature = *signature};
}

bool allows_currency(const permission_intent_t& intent,
                     const chain_id_t chain_id,
                     const std::optional<address_t>& token) {
  return std::ranges::any_of(
      intent.allowed_currencies, [&](const allowed_currency_t& currency) {
        return std::visit(
            overloaded{[&](const native_currency_t& arg) {
                         return !token && arg.chain_id == chain_id;
                       },
                       [&](const erc20_currency_t& arg) {
                         return token && arg.chain_id == chain_id &&
                                arg.token_address == *token;
                       }},
            currency);
      });
}

bool allows_effect(const permission_intent_t& intent,
                   const chain_id_t chain_id,
                   const address_t& contract,
                   const selector_t& selector) {
  return std::ranges::any_of(
      intent.allowed_effects, [&](const allowed_effect_t& effect) {
        return std::visit(
            overloaded{[&](const contract_call_effect_t& arg) {
              return arg.chain_id == chain_id &&
                     arg.contract_address == contract &&
                     arg.selector == selector;
            }},
            effect);
      });
}

compliance_result_t check_erc20_approve_compliance(
    const permission_intent_t& intent,
    const chain_id_t chain_id,
    const address_t& token) {
  if (!allows_currency(intent, chain_id, token)) {
    return {false, "token " + to_address_string(token) +
                       " is not an allowed currency on chain " +
                       std::to_string(chain_id)};
  }
  if (!allows_effect(intent, chain_id, token,
                     keyward::evm::abi::kErc20ApproveSelector)) {
    return {false, "approve is not an allowed effect on " +
                       to_address_string(token)};
  }
  return {true, {}};
}

}  // namespace keyward::intent
