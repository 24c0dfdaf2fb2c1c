#pragma once

#include <keyward/signer/hsm_client.hpp>
#include <keyward/signer/signing_backend.hpp>

#include <mutex>
#include <string>
#include <unordered_map>

namespace keyward::signer {

struct managed_hsm_options_t final {
  std::string region{"us-east-1"};
  std::string key_alias_prefix{"keyward"};
};

/// Production backend. Keys never leave the HSM. Signatures come back as DER
/// without a recovery id, so they are normalized to low-s and v is found by
/// trial recovery against the key's address.
class managed_hsm_signer final : public signing_backend {
 public:
  managed_hsm_signer(hsm_client& client, managed_hsm_options_t options);

  keyward::schema::key_provider_t provider() const override;
  key_creation_result_t create_key(const std::string& label) override;
  keyward::schema::address_t get_address(const std::string& key_id) override;
  keyward::schema::signature_result_t sign_hash(
      const std::string& key_id,
      const keyward::schema::hash32_t& digest) override;

 private:
  template <typename Fn>
  auto call_client(const std::string& key_id, Fn&& fn)
      -> decltype(fn());

  hsm_client& client_;
  managed_hsm_options_t options_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, keyward::schema::address_t> addresses_;
};

}  // namespace keyward::signer
