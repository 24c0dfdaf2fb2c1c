#pragma once
#include <keyward/schema/primitives.hpp>
#include <keyward/schema/wallet_purpose.hpp>
#include <string_view>

// Schema key type: automation wallet.
// Record, ownership slot and address index keyspaces.
namespace keyward::schema::key {

/// WALLET| wallet_id
bytes_t make_wallet_key(const hash32_t& wallet_id);

/// WALLET_OWNER| blake3(owner) purpose. Holds the wallet id of the single
/// active wallet for (owner, purpose).
bytes_t make_owner_key(const std::string_view& owner,
                       const wallet_purpose_t& purpose);

/// WALLET_ADDR| address
bytes_t make_address_key(const address_t& address);

}  // namespace keyward::schema::key
