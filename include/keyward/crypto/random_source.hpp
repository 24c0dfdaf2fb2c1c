#pragma once

#include <cstdint>
#include <span>

namespace keyward::crypto {

/// Entropy for key generation, key ids and cipher IVs.
struct random_source {
  virtual ~random_source() = default;
  virtual void fill(std::span<uint8_t> out) = 0;
};

/// RAND_bytes from the default OpenSSL DRBG.
struct openssl_random_source final : random_source {
  void fill(std::span<uint8_t> out) override;
};

}  // namespace keyward::crypto
