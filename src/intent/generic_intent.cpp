#include <keyward/intent/generic_intent.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <charconv>

namespace keyward::intent {

using namespace keyward::schema;

namespace {

const auto kHeaderFields = std::vector<eip712::field_t>{
    {"intentType", "string"}, {"signer", "address"},
    {"chainId", "uint256"},   {"nonce", "string"},
    {"signedAt", "string"},   {"expiresAt", "string"}};

bool is_hex_address(const std::string& text) {
  return text.size() == 42 && text.starts_with("0x") &&
         std::all_of(text.begin() + 2, text.end(), [](const unsigned char c) {
           return std::isxdigit(c) != 0;
         });
}

bool is_decimal(const std::string& text) {
  return !text.empty() &&
         std::ranges::all_of(text, [](const unsigned char c) {
           return std::isdigit(c) != 0;
         });
}

/// Value of the JSON kind the member's EIP-712 type expects.
bool matches_kind(const Json::Value& value, const std::string& type) {
  if (type == "string") {
    return value.isString();
  }
  if (type == "address") {
    return value.isString() && is_hex_address(value.asString());
  }
  if (type == "bool") {
    return value.isBool();
  }
  if (type.starts_with("uint")) {
    return value.isUInt64() ||
           (value.isString() && is_decimal(value.asString()));
  }
  return !value.isNull();
}

void append_error(std::string& error, const std::string& message) {
  if (!error.empty()) {
    error += ", ";
  }
  error += message;
}

template <typename T>
bool read_number(std::string_view text, std::size_t length, T& out) {
  if (text.size() < length) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + length, out);
  return ec == std::errc{} && ptr == text.data() + length;
}

}  // namespace

const std::vector<intent_type_definition_t>& intent_type_definitions() {
  static const auto definitions = std::vector<intent_type_definition_t>{
      {"test-wallet", "TestWalletIntent", {{"message", "string"}}},
      {"erc20-approve",
       "Erc20ApproveIntent",
       {{"tokenAddress", "address"},
        {"spender", "address"},
        {"amount", "uint256"}}}};
  return definitions;
}

const intent_type_definition_t* find_intent_type(
    const std::string_view& intent_type) {
  const auto& definitions = intent_type_definitions();
  auto it = std::ranges::find_if(definitions, [&](const auto& definition) {
    return definition.intent_type == intent_type;
  });
  return it == definitions.end() ? nullptr : &*it;
}

eip712::struct_types_t make_intent_types(
    const intent_type_definition_t& definition) {
  auto fields = kHeaderFields;
  fields.insert(fields.end(), definition.fields.begin(),
                definition.fields.end());
  return {{definition.primary_type, fields}};
}

Json::Value make_intent_domain(const chain_id_t chain_id) {
  auto domain = Json::Value{Json::objectValue};
  domain["name"] = std::string{kAutomationDomainName};
  domain["version"] = std::string{kAutomationDomainVersion};
  domain["chainId"] = Json::UInt64{chain_id};
  return domain;
}

std::optional<generic_intent_t> parse_generic_intent(const Json::Value& value,
                                                     std::string& error) {
  error.clear();
  if (!value.isObject()) {
    error = "intent must be an object";
    return std::nullopt;
  }

  auto intent = generic_intent_t{};

  const auto& intent_type = value["intentType"];
  if (!intent_type.isString() || intent_type.asString().empty()) {
    append_error(error, "intentType must be a non-empty string");
  } else {
    intent.intent_type = intent_type.asString();
  }

  const auto& signer = value["signer"];
  if (!signer.isString() || !is_hex_address(signer.asString())) {
    append_error(error, "signer must be a 0x prefixed 40 hex digit address");
  } else {
    intent.signer = make_address(signer.asString());
  }

  const auto& chain_id = value["chainId"];
  if (!chain_id.isUInt64() || chain_id.asUInt64() == 0) {
    append_error(error, "chainId must be a positive integer");
  } else {
    intent.chain_id = chain_id.asUInt64();
  }

  const auto& nonce = value["nonce"];
  if (!nonce.isString() || nonce.asString().empty()) {
    append_error(error, "nonce must be a non-empty string");
  } else {
    intent.nonce = nonce.asString();
  }

  for (const auto& [name, target] :
       {std::pair{"signedAt", &intent.signed_at},
        std::pair{"expiresAt", &intent.expires_at}}) {
    if (!value.isMember(name)) {
      continue;
    }
    const auto& member = value[name];
    if (!member.isString() || !parse_iso8601(member.asString())) {
      append_error(error,
                   std::string{name} + " must be an ISO-8601 UTC timestamp");
    } else {
      *target = member.asString();
    }
  }

  if (const auto* definition = find_intent_type(intent.intent_type)) {
    for (const auto& field : definition->fields) {
      if (!value.isMember(field.name) ||
          !matches_kind(value[field.name], field.type)) {
        append_error(error, field.name + " must be a valid " + field.type);
      } else {
        intent.fields[field.name] = value[field.name];
      }
    }
  } else {
    // Unregistered types are rejected later, after expiry.
    for (const auto& name : value.getMemberNames()) {
      auto is_header = std::ranges::any_of(
          kHeaderFields, [&](const auto& field) { return field.name == name; });
      if (!is_header) {
        intent.fields[name] = value[name];
      }
    }
  }

  if (!error.empty()) {
    return std::nullopt;
  }
  return intent;
}

Json::Value to_json(const generic_intent_t& intent) {
  auto value = Json::Value{Json::objectValue};
  value["intentType"] = intent.intent_type;
  value["signer"] = to_address_string(intent.signer);
  value["chainId"] = Json::UInt64{intent.chain_id};
  value["nonce"] = intent.nonce;
  if (intent.signed_at) {
    value["signedAt"] = *intent.signed_at;
  }
  if (intent.expires_at) {
    value["expiresAt"] = *intent.expires_at;
  }
  for (const auto& name : intent.fields.getMemberNames()) {
    value[name] = intent.fields[name];
  }
  return value;
}

std::optional<hash32_t> hash_generic_intent(const generic_intent_t& intent) {
  const auto* definition = find_intent_type(intent.intent_type);
  if (definition == nullptr) {
    return std::nullopt;
  }
  auto message = to_json(intent);
  message["signedAt"] = intent.signed_at.value_or("");
  message["expiresAt"] = intent.expires_at.value_or("");
  return eip712::digest(make_intent_domain(intent.chain_id),
                        definition->primary_type, message,
                        make_intent_types(*definition));
}

std::optional<timestamp_milliseconds_t> parse_iso8601(
    const std::string_view& text) {
  // YYYY-MM-DDTHH:MM:SS
  if (text.size() < 20 || text[4] != '-' || text[7] != '-' ||
      (text[10] != 'T' && text[10] != 't') || text[13] != ':' ||
      text[16] != ':') {
    return std::nullopt;
  }
  // Unsigned fields make from_chars reject a sign.
  auto year = unsigned{};
  auto month = unsigned{};
  auto day = unsigned{};
  auto hour = unsigned{};
  auto minute = unsigned{};
  auto second = unsigned{};
  if (!read_number(text.substr(0, 4), 4, year) ||
      !read_number(text.substr(5), 2, month) ||
      !read_number(text.substr(8), 2, day) ||
      !read_number(text.substr(11), 2, hour) ||
      !read_number(text.substr(14), 2, minute) ||
      !read_number(text.substr(17), 2, second)) {
    return std::nullopt;
  }
  auto date = std::chrono::year{static_cast<int>(year)} / std::chrono::month{month} /
              std::chrono::day{day};
  if (!date.ok() || hour > 23 || minute > 59 || second > 60) {
    return std::nullopt;
  }

  auto rest = text.substr(19);
  auto millis = int64_t{0};
  if (!rest.empty() && rest[0] == '.') {
    auto digits = std::size_t{1};
    while (digits < rest.size() &&
           std::isdigit(static_cast<unsigned char>(rest[digits]))) {
      ++digits;
    }
    if (digits == 1) {
      return std::nullopt;
    }
    auto fraction = rest.substr(1, std::min<std::size_t>(digits - 1, 3));
    for (std::size_t i = 0; i < 3; ++i) {
      millis = millis * 10 + (i < fraction.size() ? fraction[i] - '0' : 0);
    }
    rest = rest.substr(digits);
  }

  auto offset_minutes = int64_t{0};
  if (rest == "Z" || rest == "z") {
    offset_minutes = 0;
  } else if (rest.size() == 6 && (rest[0] == '+' || rest[0] == '-') &&
             rest[3] == ':') {
    auto offset_hours = unsigned{};
    auto offset_mins = unsigned{};
    if (!read_number(rest.substr(1), 2, offset_hours) ||
        !read_number(rest.substr(4), 2, offset_mins) || offset_hours > 23 ||
        offset_mins > 59) {
      return std::nullopt;
    }
    offset_minutes = static_cast<int64_t>(offset_hours * 60 + offset_mins);
    if (rest[0] == '-') {
      offset_minutes = -offset_minutes;
    }
  } else {
    return std::nullopt;
  }

  auto days = std::chrono::sys_days{date}.time_since_epoch().count();
  auto total = (static_cast<int64_t>(days) * 86400 +
                static_cast<int64_t>(hour * 3600 + minute * 60 + second) -
                offset_minutes * 60) *
                   1000 +
               millis;
  if (total < 0) {
    return std::nullopt;
  }
  return static_cast<timestamp_milliseconds_t>(total);
}

}  // namespace keyward::intent
