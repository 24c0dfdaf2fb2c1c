#include <keyward/intent/eip712.hpp>
#include <keyward/keccak/hash.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <iterator>
#include <limits>
#include <optional>
#include <set>

namespace keyward::intent::eip712 {

using namespace keyward::schema;

namespace {

constexpr auto kDomainFields = std::array{
    std::pair<std::string_view, std::string_view>{"name", "string"},
    std::pair<std::string_view, std::string_view>{"version", "string"},
    std::pair<std::string_view, std::string_view>{"chainId", "uint256"},
    std::pair<std::string_view, std::string_view>{"verifyingContract",
                                                  "address"},
    std::pair<std::string_view, std::string_view>{"salt", "bytes32"}};

/// "Person[]" and "Person[3]" both reduce to "Person".
std::string base_type(const std::string& type) {
  auto bracket = type.find('[');
  return bracket == std::string::npos ? type : type.substr(0, bracket);
}

bool is_array(const std::string& type) {
  return !type.empty() && type.back() == ']';
}

/// "uint256[][2]" -> "uint256[]"
std::string element_type(const std::string& type) {
  return type.substr(0, type.rfind('['));
}

void collect_dependencies(const std::string& type,
                          const struct_types_t& types,
                          std::set<std::string>& found) {
  auto name = base_type(type);
  auto it = types.find(name);
  if (it == types.end() || found.contains(name)) {
    return;
  }
  found.insert(name);
  for (const auto& field : it->second) {
    collect_dependencies(field.type, types, found);
  }
}

std::optional<std::size_t> parse_width(const std::string_view& digits) {
  if (digits.empty()) {
    return std::nullopt;
  }
  auto width = std::size_t{0};
  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), width);
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return width;
}

amount_t parse_unsigned(const Json::Value& value, const std::string& type) {
  if (value.isUInt64()) {
    return amount_t{value.asUInt64()};
  }
  if (!value.isString()) {
    throw typed_data_error{"expected " + type + " value"};
  }
  auto text = value.asString();
  if (text.starts_with("0x") || text.starts_with("0X")) {
    auto bytes = try_from_hex(std::string_view{text}.substr(2));
    if (!bytes || bytes->size() > 32) {
      throw typed_data_error{"invalid hex " + type + " value"};
    }
    return from_big_endian(*bytes);
  }
  if (text.empty() || text.size() > 78) {
    throw typed_data_error{"invalid " + type + " value"};
  }
  auto result = boost::multiprecision::uint512_t{0};
  for (const auto c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw typed_data_error{"invalid " + type + " value"};
    }
    result = result * 10 + (c - '0');
  }
  if (result > boost::multiprecision::uint512_t{
                   std::numeric_limits<amount_t>::max()}) {
    throw typed_data_error{type + " value out of range"};
  }
  return amount_t{result};
}

hash32_t encode_integer(const Json::Value& value, const std::string& type) {
  auto is_signed = type.starts_with("int");
  auto width = parse_width(std::string_view{type}.substr(is_signed ? 3 : 4));
  if (!width || *width == 0 || *width > 256 || *width % 8 != 0) {
    throw typed_data_error{"unsupported integer type " + type};
  }

  auto negative = false;
  auto magnitude = amount_t{0};
  if (is_signed && value.isInt64() && value.asInt64() < 0) {
    negative = true;
    magnitude = amount_t{static_cast<uint64_t>(-(value.asInt64() + 1)) + 1};
  } else if (is_signed && value.isString() && value.asString().starts_with("-")) {
    negative = true;
    magnitude =
        parse_unsigned(Json::Value{value.asString().substr(1)}, type);
  } else {
    magnitude = parse_unsigned(value, type);
  }

  auto bits = static_cast<unsigned>(*width);
  if (negative) {
    auto limit = amount_t{1} << (bits - 1);
    if (magnitude > limit) {
      throw typed_data_error{type + " value out of range"};
    }
    return to_word(~magnitude + 1);
  }
  if (bits < 256) {
    auto limit = amount_t{1} << (is_signed ? bits - 1 : bits);
    if (magnitude >= limit) {
      throw typed_data_error{type + " value out of range"};
    }
  }
  return to_word(magnitude);
}

bytes_t parse_hex_value(const Json::Value& value, const std::string& type) {
  if (!value.isString()) {
    throw typed_data_error{"expected hex string for " + type};
  }
  auto text = std::string_view{value.asCString()};
  if (!text.starts_with("0x") && !text.starts_with("0X")) {
    throw typed_data_error{"missing 0x prefix for " + type};
  }
  auto bytes = try_from_hex(text.substr(2));
  if (!bytes) {
    throw typed_data_error{"invalid hex for " + type};
  }
  return *bytes;
}

hash32_t encode_atomic(const std::string& type, const Json::Value& value) {
  if (type == "string") {
    if (!value.isString()) {
      throw typed_data_error{"expected string"};
    }
    return keyward::keccak::hash(value.asString());
  }
  if (type == "bytes") {
    return keyward::keccak::hash(parse_hex_value(value, type));
  }
  if (type == "bool") {
    if (!value.isBool()) {
      throw typed_data_error{"expected bool"};
    }
    return to_word(value.asBool() ? 1 : 0);
  }
  if (type == "address") {
    if (!value.isString()) {
      throw typed_data_error{"expected address string"};
    }
    auto address = try_make_address(value.asString());
    if (!address) {
      throw typed_data_error{"invalid address " + value.asString()};
    }
    auto word = hash32_t{};
    std::ranges::copy(*address, word.begin() + 12);
    return word;
  }
  if (type.starts_with("uint") || type.starts_with("int")) {
    return encode_integer(value, type);
  }
  if (type.starts_with("bytes")) {
    auto width = parse_width(std::string_view{type}.substr(5));
    if (!width || *width == 0 || *width > 32) {
      throw typed_data_error{"unsupported type " + type};
    }
    auto bytes = parse_hex_value(value, type);
    if (bytes.size() != *width) {
      throw typed_data_error{type + " value has wrong length"};
    }
    auto word = hash32_t{};
    std::ranges::copy(bytes, word.begin());
    return word;
  }
  throw typed_data_error{"unknown type " + type};
}

hash32_t encode_value(const std::string& type,
                      const Json::Value& value,
                      const struct_types_t& types) {
  if (is_array(type)) {
    if (!value.isArray()) {
      throw typed_data_error{"expected array for " + type};
    }
    auto member = element_type(type);
    auto concatenated = bytes_t{};
    for (const auto& element : value) {
      auto encoded = encode_value(member, element, types);
      std::ranges::copy(encoded, std::back_inserter(concatenated));
    }
    return keyward::keccak::hash(concatenated);
  }
  if (types.contains(type)) {
    if (!value.isObject()) {
      throw typed_data_error{"expected object for " + type};
    }
    return hash_struct(type, value, types);
  }
  return encode_atomic(type, value);
}

}  // namespace

std::string encode_type(const std::string& primary_type,
                        const struct_types_t& types) {
  auto found = std::set<std::string>{};
  collect_dependencies(primary_type, types, found);
  if (!found.contains(primary_type)) {
    throw typed_data_error{"unknown struct " + primary_type};
  }
  found.erase(primary_type);

  auto ordered = std::vector<std::string>{primary_type};
  ordered.insert(ordered.end(), found.begin(), found.end());

  auto out = std::string{};
  for (const auto& name : ordered) {
    out += name;
    out.push_back('(');
    auto first = true;
    for (const auto& field : types.at(name)) {
      if (!first) {
        out.push_back(',');
      }
      first = false;
      out += field.type;
      out.push_back(' ');
      out += field.name;
    }
    out.push_back(')');
  }
  return out;
}

hash32_t type_hash(const std::string& primary_type,
                   const struct_types_t& types) {
  return keyward::keccak::hash(encode_type(primary_type, types));
}

bytes_t encode_data(const std::string& primary_type,
                    const Json::Value& data,
                    const struct_types_t& types) {
  auto it = types.find(primary_type);
  if (it == types.end()) {
    throw typed_data_error{"unknown struct " + primary_type};
  }
  auto out = bytes_t{};
  std::ranges::copy(type_hash(primary_type, types), std::back_inserter(out));
  for (const auto& field : it->second) {
    if (!data.isMember(field.name)) {
      throw typed_data_error{primary_type + " is missing " + field.name};
    }
    auto encoded = encode_value(field.type, data[field.name], types);
    std::ranges::copy(encoded, std::back_inserter(out));
  }
  return out;
}

hash32_t hash_struct(const std::string& primary_type,
                     const Json::Value& data,
                     const struct_types_t& types) {
  return keyward::keccak::hash(encode_data(primary_type, data, types));
}

hash32_t domain_separator(const Json::Value& domain) {
  if (!domain.isObject()) {
    throw typed_data_error{"domain must be an object"};
  }
  auto fields = std::vector<field_t>{};
  for (const auto& [name, type] : kDomainFields) {
    if (domain.isMember(std::string{name})) {
      fields.push_back(field_t{std::string{name}, std::string{type}});
    }
  }
  auto types = struct_types_t{{"EIP712Domain", fields}};
  return hash_struct("EIP712Domain", domain, types);
}

hash32_t digest(const Json::Value& domain,
                const std::string& primary_type,
                const Json::Value& message,
                const struct_types_t& types) {
  auto payload = bytes_t{0x19, 0x01};
  std::ranges::copy(domain_separator(domain), std::back_inserter(payload));
  std::ranges::copy(hash_struct(primary_type, message, types),
                    std::back_inserter(payload));
  return keyward::keccak::hash(payload);
}

}  // namespace keyward::intent::eip712
