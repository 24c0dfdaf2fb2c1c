#pragma once
#include <keyward/schema/primitives.hpp>
#include <json/json.h>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// EIP-712 typed structured data hashing over JSON values.
namespace keyward::intent::eip712 {

struct field_t final {
  std::string name;
  std::string type;
};

/// Struct name to ordered member list. EIP712Domain is derived from the
/// domain value and must not be listed.
using struct_types_t = std::map<std::string, std::vector<field_t>>;

/// Raised when a value does not fit its declared type.
class typed_data_error : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

/// "Mail(Person from,Person to,string contents)Person(string name,...)"
std::string encode_type(const std::string& primary_type,
                        const struct_types_t& types);

keyward::schema::hash32_t type_hash(const std::string& primary_type,
                                    const struct_types_t& types);

keyward::schema::bytes_t encode_data(const std::string& primary_type,
                                     const Json::Value& data,
                                     const struct_types_t& types);

keyward::schema::hash32_t hash_struct(const std::string& primary_type,
                                      const Json::Value& data,
                                      const struct_types_t& types);

/// Uses whichever of name, version, chainId, verifyingContract and salt are
/// present in domain, in that order.
keyward::schema::hash32_t domain_separator(const Json::Value& domain);

/// keccak(0x19 0x01 domainSeparator hashStruct(message))
keyward::schema::hash32_t digest(const Json::Value& domain,
                                 const std::string& primary_type,
                                 const Json::Value& message,
                                 const struct_types_t& types);

}  // namespace keyward::intent::eip712
