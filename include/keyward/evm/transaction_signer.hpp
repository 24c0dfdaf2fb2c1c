#pragma once
#include <keyward/schema/primitives.hpp>
#include <keyward/signer/signing_backend.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace keyward::evm {

/// Legacy (type 0) transaction. nonce, gas_price, gas and chain_id are
/// required; an absent `to` creates a contract.
struct legacy_transaction_t final {
  std::optional<uint64_t> nonce;
  std::optional<keyward::schema::amount_t> gas_price;
  std::optional<uint64_t> gas;
  std::optional<keyward::schema::address_t> to;
  keyward::schema::amount_t value{0};
  keyward::schema::bytes_t data;
  std::optional<keyward::schema::chain_id_t> chain_id;
};

struct signed_transaction_t final {
  keyward::schema::bytes_t raw;
  keyward::schema::hash32_t hash{};
  uint64_t v{};
  keyward::schema::hash32_t r{};
  keyward::schema::hash32_t s{};
};

/// EIP-155 signing payload [nonce, gasPrice, gas, to, value, data, chainId,
/// 0, 0]. A missing required field is fatal.
keyward::schema::bytes_t encode_unsigned(const legacy_transaction_t& tx);

/// [nonce, gasPrice, gas, to, value, data, v, r, s]
keyward::schema::bytes_t encode_signed(const legacy_transaction_t& tx,
                                       uint64_t v,
                                       const keyward::schema::hash32_t& r,
                                       const keyward::schema::hash32_t& s);

keyward::schema::hash32_t signing_hash(const legacy_transaction_t& tx);

/// Sign through backend and embed v = chain_id * 2 + 35 + recovery_id.
/// Backend failures propagate unchanged.
signed_transaction_t sign_legacy_transaction(
    const legacy_transaction_t& tx,
    keyward::signer::signing_backend& backend,
    const std::string& key_id);

/// Sender of a transaction produced by sign_legacy_transaction.
std::optional<keyward::schema::address_t> recover_sender(
    const legacy_transaction_t& tx,
    const signed_transaction_t& signed_tx);

}  // namespace keyward::evm
