#include <keyward/crypto/secp256k1.hpp>
#include <keyward/keccak/hash.hpp>

#include <openssl/rand.h>
#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <span>

namespace keyward::crypto {

namespace {

struct context_deleter final {
  void operator()(secp256k1_context* ctx) const {
    secp256k1_context_destroy(ctx);
  }
};

using context_ptr = std::unique_ptr<secp256k1_context, context_deleter>;

// (n - 1) / 2
constexpr auto kHalfOrder = keyward::schema::hash32_t{
    0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0x5d, 0x57, 0x6e, 0x73, 0x57, 0xa4,
    0x50, 0x1d, 0xdf, 0xe9, 0x2f, 0x46, 0x68, 0x1b, 0x20, 0xa0};

const secp256k1_context* context() {
  static const auto ctx = [] {
    auto created = context_ptr{secp256k1_context_create(
        SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY)};
    auto seed = std::array<uint8_t, 32>{};
    if (created && RAND_bytes(seed.data(), static_cast<int>(seed.size())) == 1) {
      // Blinding only; an unrandomized context still signs correctly.
      static_cast<void>(secp256k1_context_randomize(created.get(), seed.data()));
    }
    return created;
  }();
  return ctx.get();
}

std::optional<public_key_t> serialize_public_key(
    const secp256k1_pubkey& point) {
  auto encoded = std::array<uint8_t, 65>{};
  auto length = encoded.size();
  if (secp256k1_ec_pubkey_serialize(context(), encoded.data(), &length, &point,
                                    SECP256K1_EC_UNCOMPRESSED) != 1 ||
      length != encoded.size() || encoded[0] != 0x04) {
    return std::nullopt;
  }
  auto key = public_key_t{};
  std::copy(encoded.begin() + 1, encoded.end(), key.begin());
  return key;
}

compact_signature_t split_compact(const std::array<uint8_t, 64>& compact) {
  auto out = compact_signature_t{};
  std::copy_n(compact.begin(), 32, out.r.begin());
  std::copy_n(compact.begin() + 32, 32, out.s.begin());
  return out;
}

std::array<uint8_t, 64> join_compact(const compact_signature_t& signature) {
  auto out = std::array<uint8_t, 64>{};
  std::ranges::copy(signature.r, out.begin());
  std::ranges::copy(signature.s, out.begin() + 32);
  return out;
}

bool is_zero(const keyward::schema::hash32_t& value) {
  return std::ranges::all_of(value, [](const uint8_t b) { return b == 0; });
}

}  // namespace

bool available() {
  return context() != nullptr;
}

bool is_valid_private_key(const private_key_t& key) {
  return secp256k1_ec_seckey_verify(context(), key.data()) == 1;
}

std::optional<public_key_t> derive_public_key(const private_key_t& key) {
  auto point = secp256k1_pubkey{};
  if (secp256k1_ec_pubkey_create(context(), &point, key.data()) != 1) {
    return std::nullopt;
  }
  return serialize_public_key(point);
}

keyward::schema::address_t address_from_public_key(const public_key_t& key) {
  auto digest = keyward::keccak::hash(std::span<const uint8_t>{key});
  auto address = keyward::schema::address_t{};
  std::copy(digest.begin() + 12, digest.end(), address.begin());
  return address;
}

std::optional<public_key_t> public_key_from_spki(
    const keyward::schema::bytes_view_t& der) {
  if (der.size() < 65) {
    return std::nullopt;
  }
  for (auto i = static_cast<std::ptrdiff_t>(der.size() - 65); i >= 0; --i) {
    if (der[static_cast<std::size_t>(i)] != 0x04) {
      continue;
    }
    auto point = secp256k1_pubkey{};
    if (secp256k1_ec_pubkey_parse(context(), &point,
                                  der.data() + i, 65) != 1) {
      return std::nullopt;
    }
    return serialize_public_key(point);
  }
  return std::nullopt;
}

std::optional<recoverable_signature_t> sign_recoverable(
    const private_key_t& key,
    const keyward::schema::hash32_t& digest) {
  auto signature = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_sign_recoverable(context(), &signature, digest.data(),
                                       key.data(), nullptr, nullptr) != 1) {
    return std::nullopt;
  }
  auto compact = std::array<uint8_t, 64>{};
  auto out = recoverable_signature_t{};
  if (secp256k1_ecdsa_recoverable_signature_serialize_compact(
          context(), compact.data(), &out.recovery_id, &signature) != 1) {
    return std::nullopt;
  }
  out.signature = split_compact(compact);
  return out;
}

std::optional<compact_signature_t> parse_der_signature(
    const keyward::schema::bytes_view_t& der) {
  auto signature = secp256k1_ecdsa_signature{};
  if (secp256k1_ecdsa_signature_parse_der(context(), &signature, der.data(),
                                          der.size()) != 1) {
    return std::nullopt;
  }
  auto compact = std::array<uint8_t, 64>{};
  secp256k1_ecdsa_signature_serialize_compact(context(), compact.data(),
                                              &signature);
  auto out = split_compact(compact);
  // Out of range integers parse as zero.
  if (is_zero(out.r) || is_zero(out.s)) {
    return std::nullopt;
  }
  return out;
}

bool is_low_s(const keyward::schema::hash32_t& s) {
  return !std::ranges::lexicographical_compare(kHalfOrder, s);
}

compact_signature_t normalize_low_s(const compact_signature_t& signature) {
  auto parsed = secp256k1_ecdsa_signature{};
  auto compact = join_compact(signature);
  if (secp256k1_ecdsa_signature_parse_compact(context(), &parsed,
                                              compact.data()) != 1) {
    return signature;
  }
  auto normalized = secp256k1_ecdsa_signature{};
  secp256k1_ecdsa_signature_normalize(context(), &normalized, &parsed);
  secp256k1_ecdsa_signature_serialize_compact(context(), compact.data(),
                                              &normalized);
  return split_compact(compact);
}

std::optional<public_key_t> recover_public_key(
    const keyward::schema::hash32_t& digest,
    const compact_signature_t& signature,
    const int recovery_id) {
  if (recovery_id < 0 || recovery_id > 3) {
    return std::nullopt;
  }
  auto compact = join_compact(signature);
  auto parsed = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_recoverable_signature_parse_compact(
          context(), &parsed, compact.data(), recovery_id) != 1) {
    return std::nullopt;
  }
  auto point = secp256k1_pubkey{};
  if (secp256k1_ecdsa_recover(context(), &point, &parsed, digest.data()) != 1) {
    return std::nullopt;
  }
  return serialize_public_key(point);
}

std::optional<keyward::schema::address_t> recover_address(
    const keyward::schema::hash32_t& digest,
    const compact_signature_t& signature,
    const int recovery_id) {
  auto key = recover_public_key(digest, signature, recovery_id);
  if (!key) {
    return std::nullopt;
  }
  return address_from_public_key(*key);
}

std::optional<keyward::schema::address_t> recover_address(
    const keyward::schema::hash32_t& digest,
    const keyward::schema::bytes_view_t& signature) {
  if (signature.size() != 65) {
    return std::nullopt;
  }
  auto compact = compact_signature_t{};
  std::copy_n(signature.begin(), 32, compact.r.begin());
  std::copy_n(signature.begin() + 32, 32, compact.s.begin());
  auto v = static_cast<int>(signature[64]);
  if (v >= 27) {
    v -= 27;
  }
  if (v != 0 && v != 1) {
    return std::nullopt;
  }
  return recover_address(digest, compact, v);
}

}  // namespace keyward::crypto
