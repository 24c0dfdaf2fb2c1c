#pragma once

#include <keyward/crypto/random_source.hpp>
#include <keyward/crypto/secp256k1.hpp>
#include <keyward/signer/key_cipher.hpp>
#include <keyward/signer/key_store.hpp>
#include <keyward/signer/signing_backend.hpp>

#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace keyward::signer {

/// Development backend. Private keys are generated in process, encrypted with
/// AES-256-GCM under a configured master secret and persisted through a
/// key_store. Production custody belongs to managed_hsm_signer.
class local_signer final : public signing_backend {
 public:
  /// Throws configuration_error when master_key_hex is not 64 hex characters.
  local_signer(std::string_view master_key_hex,
               key_store& store,
               keyward::crypto::random_source& random);

  keyward::schema::key_provider_t provider() const override;
  key_creation_result_t create_key(const std::string& label) override;
  keyward::schema::address_t get_address(const std::string& key_id) override;
  keyward::schema::signature_result_t sign_hash(
      const std::string& key_id,
      const keyward::schema::hash32_t& digest) override;

 private:
  keyward::crypto::private_key_t generate_private_key();
  keyward::crypto::private_key_t load_private_key(const std::string& key_id);

  key_cipher cipher_;
  key_store& store_;
  keyward::crypto::random_source& random_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, keyward::schema::address_t> addresses_;
};

}  // namespace keyward::signer
