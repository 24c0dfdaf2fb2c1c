#pragma once
#include <keyward/schema/primitives.hpp>
#include <string>

// Schema type: intent nonce record.
// Marks a (signer, chain, nonce) tuple of a generic intent as consumed.
namespace keyward::schema {

template <uint16_t Version>
struct intent_nonce_record;

template <>
struct intent_nonce_record<1> final {
  uint16_t version{1};
  std::string signer;  // lowercase 0x address
  chain_id_t chain_id{};
  std::string nonce;
  std::string intent_type;
  timestamp_milliseconds_t used_at{};
};

using intent_nonce_record_t = intent_nonce_record<1>;

}  // namespace keyward::schema
