#pragma once

#include <keyward/common/clock.hpp>
#include <keyward/schema/automation_wallet.hpp>
#include <keyward/schema/encoding/scale/encoder.hpp>
#include <keyward/schema/signature_result.hpp>
#include <keyward/signer/signing_backend.hpp>
#include <keyward/storage/rocksdb/storage.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::wallet {

/// Automation wallet lifecycle. At most one active wallet exists per owner
/// and purpose; the ownership slot is claimed in the same RocksDB transaction
/// that writes the wallet record and its address index.
class wallet_registry final {
 public:
  using storage_t =
      keyward::storage::storage<keyward::storage::rocksdb_storage_tag>;

  wallet_registry(storage_t& storage,
                  keyward::signer::signing_backend& backend,
                  keyward::common::clock_fn_t clock =
                      keyward::common::now_milliseconds);

  /// Throws wallet_exists when (owner, purpose) already has an active wallet.
  keyward::schema::automation_wallet_t create(
      const std::string& owner,
      const keyward::schema::wallet_purpose_t& purpose,
      const std::string& label =
          std::string{keyward::schema::kDefaultWalletLabel});

  std::optional<keyward::schema::automation_wallet_t> get_by_owner(
      const std::string& owner,
      const keyward::schema::wallet_purpose_t& purpose =
          keyward::schema::automation_purpose{});

  /// Active or deactivated wallet that owns address.
  std::optional<keyward::schema::automation_wallet_t> get_by_address(
      const keyward::schema::address_t& address);

  std::optional<keyward::schema::automation_wallet_t> get_by_id(
      const keyward::schema::hash32_t& wallet_id);

  /// Every wallet ever created for owner, deactivated ones included.
  std::vector<keyward::schema::automation_wallet_t> list_by_owner(
      const std::string& owner);

  /// Returns false when there is no active wallet. The record is kept.
  bool deactivate(const std::string& owner,
                  const keyward::schema::wallet_purpose_t& purpose =
                      keyward::schema::automation_purpose{});

  keyward::schema::automation_wallet_t get_or_create(
      const std::string& owner,
      const keyward::schema::wallet_purpose_t& purpose =
          keyward::schema::automation_purpose{},
      const std::string& label =
          std::string{keyward::schema::kDefaultWalletLabel});

  /// Best effort last_used_at update. Returns false for an unknown wallet.
  bool touch(const keyward::schema::hash32_t& wallet_id);

  /// Throws wallet_not_found when owner has no active wallet for purpose.
  /// Backend failures propagate and leave last_used_at untouched.
  keyward::schema::signature_result_t sign_hash_for(
      const std::string& owner,
      const keyward::schema::wallet_purpose_t& purpose,
      const keyward::schema::hash32_t& digest);

  keyward::signer::signing_backend& backend() { return backend_; }

 private:
  using encoder_t = keyward::schema::encoding::encoder<
      keyward::schema::encoding::scale_encoder_tag>;

  storage_t& storage_;
  keyward::signer::signing_backend& backend_;
  keyward::common::clock_fn_t clock_;
};

/// Record id, unique per created key. Ownership is tracked separately by the
/// WALLET_OWNER index.
keyward::schema::hash32_t make_wallet_id(
    const keyward::schema::wallet_purpose_t& purpose,
    const keyward::schema::address_t& address);

}  // namespace keyward::wallet
