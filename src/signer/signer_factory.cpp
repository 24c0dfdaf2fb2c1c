#include <keyward/common/signer_error.hpp>
#include <keyward/signer/local_signer.hpp>
#include <keyward/signer/managed_hsm_signer.hpp>
#include <keyward/signer/signer_factory.hpp>

#include <spdlog/spdlog.h>

namespace keyward::signer {

std::unique_ptr<signing_backend> make_signing_backend(
    const keyward::common::config& options,
    key_store& store,
    keyward::crypto::random_source& random,
    hsm_client* client) {
  switch (options.signer_backend) {
    case keyward::schema::key_provider_t::local: {
      spdlog::info("Using local signing backend");
      return std::make_unique<local_signer>(options.local_encryption_key, store,
                                            random);
    }
    case keyward::schema::key_provider_t::managed_hsm: {
      if (client == nullptr) {
        throw keyward::common::signer_error{
            keyward::schema::signer_error_code_t::configuration_error,
            "managed-hsm backend needs an hsm_client from the embedding "
            "application"};
      }
      if (options.hsm_region.empty()) {
        throw keyward::common::signer_error{
            keyward::schema::signer_error_code_t::configuration_error,
            "managed-hsm backend requires a region"};
      }
      spdlog::info("Using managed HSM signing backend in {}",
                   options.hsm_region);
      return std::make_unique<managed_hsm_signer>(
          *client, managed_hsm_options_t{
                       .region = options.hsm_region,
                       .key_alias_prefix = options.hsm_key_alias_prefix});
    }
  }
  throw keyward::common::signer_error{
      keyward::schema::signer_error_code_t::configuration_error,
      "unknown signer backend"};
}

}  // namespace keyward::signer
