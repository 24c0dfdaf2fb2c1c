#pragma once

#include <keyward/schema/encoding/scale/encoder.hpp>
#include <keyward/schema/nonce_record.hpp>
#include <keyward/storage/rocksdb/storage.hpp>
#include <keyward/wallet/wallet_registry.hpp>

#include <cstdint>
#include <string>

namespace keyward::wallet {

/// Per (wallet, chain) transaction counter. Allocation is a single RocksDB
/// pessimistic transaction, so concurrent callers in any process never see
/// the same nonce.
class nonce_allocator final {
 public:
  using storage_t =
      keyward::storage::storage<keyward::storage::rocksdb_storage_tag>;

  nonce_allocator(storage_t& storage, wallet_registry& registry);

  /// Returns the current counter and stores counter + 1. The first
  /// allocation for a pair returns 0.
  uint64_t allocate_and_increment(const keyward::schema::hash32_t& wallet_id,
                                  keyward::schema::chain_id_t chain_id);

  /// Next nonce without allocating it, 0 when nothing was allocated yet.
  uint64_t peek(const keyward::schema::hash32_t& wallet_id,
                keyward::schema::chain_id_t chain_id);

  /// Overwrites the counter. Manual recovery only, for when the chain and
  /// the allocator have diverged.
  void reset(const keyward::schema::hash32_t& wallet_id,
             keyward::schema::chain_id_t chain_id,
             uint64_t nonce);

  // Owner variants resolve the active automation wallet first and throw
  // no_wallet when there is none.
  uint64_t allocate_for_owner(const std::string& owner,
                              keyward::schema::chain_id_t chain_id);
  uint64_t peek_for_owner(const std::string& owner,
                          keyward::schema::chain_id_t chain_id);
  void reset_for_owner(const std::string& owner,
                       keyward::schema::chain_id_t chain_id,
                       uint64_t nonce);

 private:
  using encoder_t = keyward::schema::encoding::encoder<
      keyward::schema::encoding::scale_encoder_tag>;

  keyward::schema::hash32_t resolve_owner(const std::string& owner);

  storage_t& storage_;
  wallet_registry& registry_;
};

}  // namespace keyward::wallet
