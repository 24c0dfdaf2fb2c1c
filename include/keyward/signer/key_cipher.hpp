#pragma once

#include <keyward/crypto/random_source.hpp>
#include <keyward/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace keyward::signer {

/// AES-256-GCM envelope for local key material.
/// Record format: base64(iv):base64(tag):base64(ciphertext)
class key_cipher final {
 public:
  static constexpr std::size_t kIvSize = 12;
  static constexpr std::size_t kTagSize = 16;

  key_cipher(const std::array<uint8_t, 32>& master_key,
             keyward::crypto::random_source& random);
  ~key_cipher();

  key_cipher(const key_cipher&) = delete;
  key_cipher& operator=(const key_cipher&) = delete;

  /// Throws configuration_error unless the input is exactly 64 hex characters.
  static std::array<uint8_t, 32> parse_master_key(std::string_view hex);

  std::string encrypt(const keyward::schema::bytes_view_t& plaintext) const;

  /// Throws signing_failed on a malformed record or authentication failure.
  keyward::schema::bytes_t decrypt(std::string_view record) const;

 private:
  std::array<uint8_t, 32> master_key_;
  keyward::crypto::random_source& random_;
};

}  // namespace keyward::signer
