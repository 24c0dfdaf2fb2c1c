#include <keyward/common/signer_error.hpp>
#include <keyward/signer/key_cipher.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <memory>

namespace keyward::signer {

namespace {

using evp_cipher_ctx_ptr =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using keyward::common::signer_error;
using keyward::schema::signer_error_code_t;

[[noreturn]] void fail_decrypt(const std::string& message) {
  throw signer_error{signer_error_code_t::signing_failed, message};
}

}  // namespace

key_cipher::key_cipher(const std::array<uint8_t, 32>& master_key,
                       keyward::crypto::random_source& random)
    : master_key_(master_key), random_(random) {}

key_cipher::~key_cipher() {
  OPENSSL_cleanse(master_key_.data(), master_key_.size());
}

std::array<uint8_t, 32> key_cipher::parse_master_key(std::string_view hex) {
  if (hex.size() != 64) {
    throw signer_error{signer_error_code_t::configuration_error,
                       "local encryption key must be 64 hex characters"};
  }
  auto decoded = keyward::schema::try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    throw signer_error{signer_error_code_t::configuration_error,
                       "local encryption key is not valid hex"};
  }
  auto key = std::array<uint8_t, 32>{};
  std::copy(decoded->begin(), decoded->end(), key.begin());
  OPENSSL_cleanse(decoded->data(), decoded->size());
  return key;
}

std::string key_cipher::encrypt(
    const keyward::schema::bytes_view_t& plaintext) const {
  auto iv = std::array<uint8_t, kIvSize>{};
  random_.fill(iv);

  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx ||
      EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(iv.size()), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, master_key_.data(),
                         iv.data()) != 1) {
    throw signer_error{signer_error_code_t::signing_failed,
                       "failed to initialise AES-256-GCM"};
  }

  auto ciphertext = keyward::schema::bytes_t(plaintext.size() + 16);
  auto written = 0;
  if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &written,
                        plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    throw signer_error{signer_error_code_t::signing_failed,
                       "failed to encrypt key material"};
  }
  auto total = written;
  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &written) !=
      1) {
    throw signer_error{signer_error_code_t::signing_failed,
                       "failed to finalise key encryption"};
  }
  total += written;
  ciphertext.resize(static_cast<std::size_t>(total));

  auto tag = std::array<uint8_t, kTagSize>{};
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(tag.size()), tag.data()) != 1) {
    throw signer_error{signer_error_code_t::signing_failed,
                       "failed to read authentication tag"};
  }

  return keyward::schema::to_base64(keyward::schema::bytes_view_t{iv}) + ":" +
         keyward::schema::to_base64(keyward::schema::bytes_view_t{tag}) + ":" +
         keyward::schema::to_base64(ciphertext);
}

keyward::schema::bytes_t key_cipher::decrypt(std::string_view record) const {
  auto first = record.find(':');
  auto second = first == std::string_view::npos
                    ? std::string_view::npos
                    : record.find(':', first + 1);
  if (second == std::string_view::npos ||
      record.find(':', second + 1) != std::string_view::npos) {
    fail_decrypt("invalid encrypted key format");
  }

  auto iv = keyward::schema::try_from_base64(record.substr(0, first));
  auto tag = keyward::schema::try_from_base64(
      record.substr(first + 1, second - first - 1));
  auto ciphertext = keyward::schema::try_from_base64(record.substr(second + 1));
  if (!iv || !tag || !ciphertext || iv->size() != kIvSize ||
      tag->size() != kTagSize) {
    fail_decrypt("invalid encrypted key format");
  }

  auto ctx = evp_cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx ||
      EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(iv->size()), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, master_key_.data(),
                         iv->data()) != 1) {
    fail_decrypt("failed to initialise AES-256-GCM");
  }

  auto plaintext = keyward::schema::bytes_t(ciphertext->size() + 16);
  auto written = 0;
  if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &written,
                        ciphertext->data(),
                        static_cast<int>(ciphertext->size())) != 1) {
    fail_decrypt("failed to decrypt key material");
  }
  auto total = written;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(tag->size()), tag->data()) != 1 ||
      EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &written) !=
          1) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    fail_decrypt("key material failed authentication");
  }
  total += written;
  plaintext.resize(static_cast<std::size_t>(total));
  return plaintext;
}

}  // namespace keyward::signer
