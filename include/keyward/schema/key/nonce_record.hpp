#pragma once
#include <keyward/schema/primitives.hpp>

// Schema key type: nonce record.
// Transaction counter keyspace, one entry per wallet and chain.
namespace keyward::schema::key {

bytes_t make_key(const hash32_t& wallet_id, chain_id_t chain_id);

}  // namespace keyward::schema::key
