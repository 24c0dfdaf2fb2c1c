#include <keyward/common/signer_error.hpp>
#include <keyward/crypto/random_source.hpp>

#include <openssl/rand.h>

namespace keyward::crypto {

void openssl_random_source::fill(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw keyward::common::signer_error{
        keyward::schema::signer_error_code_t::signing_failed,
        "OpenSSL random generator failed"};
  }
}

}  // namespace keyward::crypto
