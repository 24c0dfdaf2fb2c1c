#pragma once

#include <keyward/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>

namespace keyward::crypto {

using private_key_t = std::array<uint8_t, 32>;
/// Uncompressed point without the 0x04 marker: x || y.
using public_key_t = std::array<uint8_t, 64>;

struct compact_signature_t final {
  keyward::schema::hash32_t r{};
  keyward::schema::hash32_t s{};
};

struct recoverable_signature_t final {
  compact_signature_t signature;
  int recovery_id{0};
};

/// True when the libsecp256k1 context could be created.
bool available();

/// 1 <= key < n.
bool is_valid_private_key(const private_key_t& key);

std::optional<public_key_t> derive_public_key(const private_key_t& key);

/// keccak(x || y)[12:]
keyward::schema::address_t address_from_public_key(const public_key_t& key);

/// Locate the uncompressed point in a DER SubjectPublicKeyInfo by scanning
/// backwards from len - 65 for the 0x04 marker.
std::optional<public_key_t> public_key_from_spki(
    const keyward::schema::bytes_view_t& der);

/// Low-s ECDSA over a precomputed 32 byte digest. The recovery id is the one
/// libsecp256k1 reports for the signature.
std::optional<recoverable_signature_t> sign_recoverable(
    const private_key_t& key,
    const keyward::schema::hash32_t& digest);

/// Parse `30 len 02 rlen r 02 slen s`. r and s must be in [1, n).
std::optional<compact_signature_t> parse_der_signature(
    const keyward::schema::bytes_view_t& der);

bool is_low_s(const keyward::schema::hash32_t& s);

/// s > n/2 becomes n - s.
compact_signature_t normalize_low_s(const compact_signature_t& signature);

std::optional<public_key_t> recover_public_key(
    const keyward::schema::hash32_t& digest,
    const compact_signature_t& signature,
    int recovery_id);

std::optional<keyward::schema::address_t> recover_address(
    const keyward::schema::hash32_t& digest,
    const compact_signature_t& signature,
    int recovery_id);

/// 65 byte r || s || v with v in {0, 1, 27, 28}.
std::optional<keyward::schema::address_t> recover_address(
    const keyward::schema::hash32_t& digest,
    const keyward::schema::bytes_view_t& signature);

}  // namespace keyward::crypto
