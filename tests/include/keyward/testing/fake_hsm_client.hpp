#pragma once

#include <keyward/crypto/secp256k1.hpp>
#include <keyward/schema/primitives.hpp>
#include <keyward/signer/hsm_client.hpp>

#include <algorithm>
#include <atomic>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace keyward::testing {

/// In-process HSM over OpenSSL. Keys are sequential scalars so addresses are
/// predictable. Optionally returns high-s signatures, like a real HSM may.
class fake_hsm_client final : public keyward::signer::hsm_client {
 public:
  bool force_high_s{false};
  bool fail_requests{false};
  // Sign with this key instead of the requested one.
  std::optional<std::string> sign_with_key;

  std::string create_key(const keyward::signer::hsm_key_spec_t& spec) override {
    check_available();
    auto lock = std::scoped_lock{mutex_};
    last_spec = spec;
    auto key_id = "hsm-key-" + std::to_string(keys_.size() + 1);
    keys_[key_id] = make_private_key(keys_.size() + 1);
    return key_id;
  }

  keyward::schema::bytes_t get_public_key(const std::string& key_id) override {
    check_available();
    ++public_key_requests;
    auto key = find(key_id);
    auto point = keyward::crypto::derive_public_key(key);
    auto spki = keyward::schema::from_hex(
        "3056301006072a8648ce3d020106052b8104000a034200");
    spki.push_back(0x04);
    std::ranges::copy(*point, std::back_inserter(spki));
    return spki;
  }

  keyward::schema::bytes_t sign(const std::string& key_id,
                                const keyward::schema::hash32_t& digest) override {
    check_available();
    auto key = find(sign_with_key.value_or(key_id));
    // An HSM returns plain DER, so the recovery id is dropped here.
    auto signature = keyward::crypto::sign_recoverable(key, digest)->signature;
    if (force_high_s) {
      signature.s = negate(signature.s);
    }
    return encode_der(signature);
  }

  static keyward::schema::bytes_t encode_der(
      const keyward::crypto::compact_signature_t& signature) {
    auto r = encode_der_integer(signature.r);
    auto s = encode_der_integer(signature.s);
    auto out = keyward::schema::bytes_t{
        0x30, static_cast<uint8_t>(r.size() + s.size())};
    std::ranges::copy(r, std::back_inserter(out));
    std::ranges::copy(s, std::back_inserter(out));
    return out;
  }

  /// n - value
  static keyward::schema::hash32_t negate(const keyward::schema::hash32_t& value) {
    auto order = keyward::schema::from_big_endian(keyward::schema::from_hex(
        "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"));
    return keyward::schema::to_word(order -
                                    keyward::schema::from_big_endian(value));
  }

  std::optional<keyward::signer::hsm_key_spec_t> last_spec;
  std::atomic<int> public_key_requests{0};

 private:
  static keyward::crypto::private_key_t make_private_key(const std::size_t n) {
    auto key = keyward::crypto::private_key_t{};
    key[31] = static_cast<uint8_t>(n);
    key[0] = 0x11;
    return key;
  }

  static keyward::schema::bytes_t encode_der_integer(
      const keyward::schema::hash32_t& value) {
    auto first = std::ranges::find_if(value, [](auto b) { return b != 0; });
    auto body = keyward::schema::bytes_t(first, value.end());
    if (body.empty() || (body.front() & 0x80) != 0) {
      body.insert(body.begin(), 0x00);
    }
    auto out = keyward::schema::bytes_t{0x02, static_cast<uint8_t>(body.size())};
    std::ranges::copy(body, std::back_inserter(out));
    return out;
  }

  void check_available() const {
    if (fail_requests) {
      throw keyward::signer::hsm_error{keyward::signer::hsm_error_kind_t::unavailable,
                                       "request timed out"};
    }
  }

  keyward::crypto::private_key_t find(const std::string& key_id) {
    auto lock = std::scoped_lock{mutex_};
    auto it = keys_.find(key_id);
    if (it == keys_.end()) {
      throw keyward::signer::hsm_error{keyward::signer::hsm_error_kind_t::not_found,
                                       "key " + key_id + " does not exist"};
    }
    return it->second;
  }

  std::mutex mutex_;
  std::map<std::string, keyward::crypto::private_key_t> keys_;
};

}  // namespace keyward::testing
