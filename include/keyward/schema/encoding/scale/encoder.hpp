#pragma once
#include <keyward/common/critical.hpp>
#include <keyward/schema/encoding/encoder.hpp>
#include <keyward/schema/encoding/scale/automation_wallet.hpp>
#include <keyward/schema/encoding/scale/intent_nonce_record.hpp>
#include <keyward/schema/encoding/scale/nonce_record.hpp>
#include <keyward/schema/encoding/scale/signing_key.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace keyward::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  keyward::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, keyward::schema::bytes_t& out);

  template <typename T>
  T decode(const keyward::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const keyward::schema::bytes_view_t& bytes);
};

template <typename T>
keyward::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    keyward::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        keyward::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const keyward::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    keyward::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const keyward::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace keyward::schema::encoding
