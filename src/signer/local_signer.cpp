#include <keyward/common/signer_error.hpp>
#include <keyward/signer/local_signer.hpp>

#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>

namespace keyward::signer {

namespace {

using keyward::common::signer_error;
using keyward::schema::signer_error_code_t;

constexpr auto kKeyIdPrefix = std::string_view{"local-"};
constexpr auto kMaxKeyDraws = 16;

std::array<uint8_t, 32> require_master_key(const std::string_view hex) {
  if (hex.empty()) {
    throw signer_error{signer_error_code_t::configuration_error,
                       "local encryption key is not configured"};
  }
  return key_cipher::parse_master_key(hex);
}

/// Wipes private key bytes when the owning scope exits.
struct scoped_cleanse final {
  keyward::crypto::private_key_t& key;
  ~scoped_cleanse() { OPENSSL_cleanse(key.data(), key.size()); }
};

}  // namespace

local_signer::local_signer(std::string_view master_key_hex,
                           key_store& store,
                           keyward::crypto::random_source& random)
    : cipher_(require_master_key(master_key_hex), random),
      store_(store),
      random_(random) {
  spdlog::info("Local signing backend initialised");
}

keyward::schema::key_provider_t local_signer::provider() const {
  return keyward::schema::key_provider_t::local;
}

keyward::crypto::private_key_t local_signer::generate_private_key() {
  auto key = keyward::crypto::private_key_t{};
  for (auto draw = 0; draw < kMaxKeyDraws; ++draw) {
    random_.fill(key);
    if (keyward::crypto::is_valid_private_key(key)) {
      return key;
    }
  }
  OPENSSL_cleanse(key.data(), key.size());
  throw signer_error{signer_error_code_t::signing_failed,
                     "failed to draw a valid private key"};
}

key_creation_result_t local_signer::create_key(const std::string& label) {
  auto key = generate_private_key();
  auto cleanse = scoped_cleanse{key};

  auto public_key = keyward::crypto::derive_public_key(key);
  if (!public_key) {
    throw signer_error{signer_error_code_t::signing_failed,
                       "failed to derive public key"};
  }
  auto address = keyward::crypto::address_from_public_key(*public_key);

  auto id_bytes = std::array<uint8_t, 16>{};
  random_.fill(id_bytes);
  auto key_id = std::string{kKeyIdPrefix} +
                keyward::schema::to_hex(keyward::schema::bytes_view_t{id_bytes});

  auto encrypted = cipher_.encrypt(keyward::schema::bytes_view_t{key});
  store_.save(key_id, encrypted);

  {
    auto lock = std::scoped_lock{mutex_};
    addresses_[key_id] = address;
  }

  spdlog::info("Created local signing key {} ({}) for '{}'", key_id,
               keyward::schema::to_address_string(address), label);
  return key_creation_result_t{.key_id = key_id,
                               .wallet_address = address,
                               .encrypted_material = encrypted};
}

keyward::crypto::private_key_t local_signer::load_private_key(
    const std::string& key_id) {
  auto record = store_.load(key_id);
  if (!record) {
    throw signer_error{signer_error_code_t::key_not_found,
                       "Key not found: " + key_id};
  }
  auto plaintext = cipher_.decrypt(*record);
  if (plaintext.size() != std::tuple_size_v<keyward::crypto::private_key_t>) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    throw signer_error{signer_error_code_t::signing_failed,
                       "decrypted key material has the wrong length"};
  }
  auto key = keyward::crypto::private_key_t{};
  std::copy(plaintext.begin(), plaintext.end(), key.begin());
  OPENSSL_cleanse(plaintext.data(), plaintext.size());
  return key;
}

keyward::schema::address_t local_signer::get_address(
    const std::string& key_id) {
  {
    auto lock = std::scoped_lock{mutex_};
    auto it = addresses_.find(key_id);
    if (it != addresses_.end()) {
      return it->second;
    }
  }

  auto key = load_private_key(key_id);
  auto cleanse = scoped_cleanse{key};
  auto public_key = keyward::crypto::derive_public_key(key);
  if (!public_key) {
    throw signer_error{signer_error_code_t::signing_failed,
                       "stored key material is not a valid secp256k1 key"};
  }
  auto address = keyward::crypto::address_from_public_key(*public_key);

  auto lock = std::scoped_lock{mutex_};
  return addresses_.try_emplace(key_id, address).first->second;
}

keyward::schema::signature_result_t local_signer::sign_hash(
    const std::string& key_id,
    const keyward::schema::hash32_t& digest) {
  auto key = load_private_key(key_id);
  auto cleanse = scoped_cleanse{key};

  auto signed_digest = keyward::crypto::sign_recoverable(key, digest);
  if (!signed_digest) {
    throw signer_error{signer_error_code_t::signing_failed,
                       "ECDSA signing failed for key " + key_id};
  }
  if (signed_digest->recovery_id > 1) {
    throw signer_error{signer_error_code_t::recovery_failed,
                       "Recovery id out of range for key " + key_id};
  }
  const auto& signature = signed_digest->signature;
  spdlog::debug("Signed digest with local key {}", key_id);
  return keyward::schema::make_signature_result(
      signature.r, signature.s,
      static_cast<uint8_t>(27 + signed_digest->recovery_id));
}

}  // namespace keyward::signer
