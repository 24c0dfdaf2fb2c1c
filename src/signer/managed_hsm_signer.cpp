#include <keyward/common/signer_error.hpp>
#include <keyward/crypto/secp256k1.hpp>
#include <keyward/signer/managed_hsm_signer.hpp>

#include <spdlog/spdlog.h>

namespace keyward::signer {

namespace {

using keyward::common::signer_error;
using keyward::schema::signer_error_code_t;

}  // namespace

managed_hsm_signer::managed_hsm_signer(hsm_client& client,
                                       managed_hsm_options_t options)
    : client_(client), options_(std::move(options)) {
  spdlog::info("Managed HSM signing backend initialised (region {})",
               options_.region);
}

keyward::schema::key_provider_t managed_hsm_signer::provider() const {
  return keyward::schema::key_provider_t::managed_hsm;
}

template <typename Fn>
auto managed_hsm_signer::call_client(const std::string& key_id, Fn&& fn)
    -> decltype(fn()) {
  try {
    return fn();
  } catch (const hsm_error& e) {
    if (e.kind() == hsm_error_kind_t::not_found) {
      throw signer_error{signer_error_code_t::key_not_found,
                         "Key not found: " + key_id};
    }
    spdlog::error("Managed HSM call failed for key {}: {}", key_id, e.what());
    throw signer_error{signer_error_code_t::signing_failed, e.what()};
  } catch (const signer_error&) {
    throw;
  } catch (const std::exception& e) {
    spdlog::error("Managed HSM call failed for key {}: {}", key_id, e.what());
    throw signer_error{signer_error_code_t::signing_failed, e.what()};
  }
}

key_creation_result_t managed_hsm_signer::create_key(const std::string& label) {
  auto spec = hsm_key_spec_t{};
  spec.description = options_.key_alias_prefix + " automation wallet: " + label;
  spec.tags = {{"Application", options_.key_alias_prefix},
               {"Label", label},
               {"Region", options_.region}};

  auto key_id =
      call_client(label, [&] { return client_.create_key(spec); });
  auto address = get_address(key_id);

  spdlog::info("Created managed HSM key {} ({}) for '{}'", key_id,
               keyward::schema::to_address_string(address), label);
  return key_creation_result_t{.key_id = key_id, .wallet_address = address};
}

keyward::schema::address_t managed_hsm_signer::get_address(
    const std::string& key_id) {
  {
    auto lock = std::scoped_lock{mutex_};
    auto it = addresses_.find(key_id);
    if (it != addresses_.end()) {
      return it->second;
    }
  }

  auto der =
      call_client(key_id, [&] { return client_.get_public_key(key_id); });
  auto public_key = keyward::crypto::public_key_from_spki(der);
  if (!public_key) {
    throw signer_error{signer_error_code_t::signing_failed,
                       "Could not extract public key from HSM response"};
  }
  auto address = keyward::crypto::address_from_public_key(*public_key);

  auto lock = std::scoped_lock{mutex_};
  return addresses_.try_emplace(key_id, address).first->second;
}

keyward::schema::signature_result_t managed_hsm_signer::sign_hash(
    const std::string& key_id,
    const keyward::schema::hash32_t& digest) {
  auto address = get_address(key_id);
  auto der =
      call_client(key_id, [&] { return client_.sign(key_id, digest); });

  auto parsed = keyward::crypto::parse_der_signature(der);
  if (!parsed) {
    throw signer_error{signer_error_code_t::signing_failed,
                       "Invalid DER signature from HSM"};
  }
  auto signature = keyward::crypto::normalize_low_s(*parsed);

  for (auto v = uint8_t{27}; v <= 28; ++v) {
    auto recovered = keyward::crypto::recover_address(digest, signature, v - 27);
    if (recovered && *recovered == address) {
      spdlog::debug("Signed digest with managed HSM key {}", key_id);
      return keyward::schema::make_signature_result(signature.r, signature.s,
                                                    v);
    }
  }
  spdlog::error("Could not recover HSM signature to {} for key {}",
                keyward::schema::to_address_string(address), key_id);
  throw signer_error{signer_error_code_t::recovery_failed,
                     "Could not recover valid v value"};
}

}  // namespace keyward::signer
