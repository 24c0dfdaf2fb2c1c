#pragma once

#include <keyward/schema/key_provider.hpp>
#include <keyward/schema/primitives.hpp>
#include <keyward/schema/signature_result.hpp>

#include <optional>
#include <string>

namespace keyward::signer {

struct key_creation_result_t final {
  std::string key_id;
  keyward::schema::address_t wallet_address{};
  // Set by the local backend only.
  std::optional<std::string> encrypted_material;
};

/// Custody backend. Implementations sign raw 32 byte digests with no message
/// prefix, so the recovered address matches the transaction sender.
///
/// All operations throw keyward::common::signer_error.
class signing_backend {
 public:
  virtual ~signing_backend() = default;

  virtual keyward::schema::key_provider_t provider() const = 0;

  /// Generate a new key. label is descriptive metadata only.
  virtual key_creation_result_t create_key(const std::string& label) = 0;

  /// Throws key_not_found for an unknown key id.
  virtual keyward::schema::address_t get_address(const std::string& key_id) = 0;

  /// v is 27 or 28. Throws key_not_found or signing_failed.
  virtual keyward::schema::signature_result_t sign_hash(
      const std::string& key_id,
      const keyward::schema::hash32_t& digest) = 0;

  /// EIP-712 digest signing.
  keyward::schema::signature_result_t sign_typed_data_hash(
      const std::string& key_id,
      const keyward::schema::hash32_t& digest) {
    return sign_hash(key_id, digest);
  }

  /// Unsigned transaction digest signing.
  keyward::schema::signature_result_t sign_transaction(
      const std::string& key_id,
      const keyward::schema::hash32_t& digest) {
    return sign_hash(key_id, digest);
  }
};

}  // namespace keyward::signer
