#pragma once
#include <keyward/schema/primitives.hpp>
#include <string_view>

// Schema key type: intent nonce record.
// Consumed generic intent nonces, keyed by signer, chain and nonce.
namespace keyward::schema::key {

bytes_t make_intent_nonce_key(const address_t& signer,
                              chain_id_t chain_id,
                              const std::string_view& nonce);

}  // namespace keyward::schema::key
