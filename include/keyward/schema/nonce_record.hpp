#pragma once
#include <keyward/schema/primitives.hpp>

// Schema type: nonce record.
// Per wallet and chain transaction counter. next_nonce is the value handed out
// by the next allocation.
namespace keyward::schema {

template <uint16_t Version>
struct nonce_record;

template <>
struct nonce_record<1> final {
  uint16_t version{1};
  hash32_t wallet_id{};
  chain_id_t chain_id{};
  uint64_t next_nonce{};
};

using nonce_record_t = nonce_record<1>;

}  // namespace keyward::schema
