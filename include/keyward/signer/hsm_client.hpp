#pragma once

#include <keyward/schema/primitives.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace keyward::signer {

/// Key creation request sent to the managed HSM service.
struct hsm_key_spec_t final {
  std::string key_spec{"ECC_SECG_P256K1"};
  std::string key_usage{"SIGN_VERIFY"};
  std::string description;
  std::vector<std::pair<std::string, std::string>> tags;
};

enum class hsm_error_kind_t : uint8_t { not_found = 0, unavailable = 1 };

/// Raised by hsm_client implementations.
class hsm_error : public std::runtime_error {
 public:
  hsm_error(hsm_error_kind_t kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  hsm_error_kind_t kind() const noexcept { return kind_; }

 private:
  hsm_error_kind_t kind_;
};

/// Transport to a remote managed HSM. Calls may block on the network;
/// implementations apply their own timeout and report it as unavailable.
struct hsm_client {
  virtual ~hsm_client() = default;

  virtual std::string create_key(const hsm_key_spec_t& spec) = 0;

  /// DER encoded SubjectPublicKeyInfo.
  virtual keyward::schema::bytes_t get_public_key(const std::string& key_id) = 0;

  /// DER encoded ECDSA signature over the raw digest.
  virtual keyward::schema::bytes_t sign(
      const std::string& key_id,
      const keyward::schema::hash32_t& digest) = 0;
};

}  // namespace keyward::signer
