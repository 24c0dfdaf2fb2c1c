#pragma once

#include <keyward/common/clock.hpp>
#include <keyward/intent/generic_intent.hpp>
#include <keyward/intent/permission_intent.hpp>
#include <keyward/schema/encoding/scale/encoder.hpp>
#include <keyward/schema/intent_error_code.hpp>
#include <keyward/storage/rocksdb/storage.hpp>

#include <optional>
#include <string>

namespace keyward::intent {

/// Rejections are reported here and never thrown.
template <typename Intent>
struct verification_result final {
  bool valid{false};
  std::string error;
  std::optional<keyward::schema::intent_error_code_t> error_code;
  std::optional<Intent> intent;
  std::optional<keyward::schema::address_t> recovered_address;
};

using generic_verification_result_t = verification_result<generic_intent_t>;
using permission_verification_result_t =
    verification_result<permission_intent_t>;

struct verify_options_t final {
  bool skip_nonce_check{false};
};

class intent_verifier final {
 public:
  using storage_t =
      keyward::storage::storage<keyward::storage::rocksdb_storage_tag>;

  explicit intent_verifier(storage_t& storage,
                           keyward::common::clock_fn_t clock =
                               keyward::common::now_milliseconds);

  /// Checks schema, expiry, intent type, signature, signer and nonce, in
  /// that order. Nothing is written.
  generic_verification_result_t verify(const signed_generic_intent_t& signed_intent,
                                       const verify_options_t& options = {});
  generic_verification_result_t verify(const signed_generic_intent_t& signed_intent,
                                       const verify_options_t& options,
                                       keyward::schema::timestamp_milliseconds_t now);

  /// Mark the intent's nonce consumed once the authorized action happened.
  /// Returns false when it was already recorded.
  bool record_nonce_used(const generic_intent_t& intent);
  bool record_nonce_used(const generic_intent_t& intent,
                         keyward::schema::timestamp_milliseconds_t now);

  bool is_nonce_used(const keyward::schema::address_t& signer,
                     keyward::schema::chain_id_t chain_id,
                     const std::string& nonce);

  /// Signature check only. The same grant may be verified any number of
  /// times.
  permission_verification_result_t verify_permission(
      const signed_permission_intent_t& signed_intent) const;

 private:
  using encoder_t = keyward::schema::encoding::encoder<
      keyward::schema::encoding::scale_encoder_tag>;

  storage_t& storage_;
  keyward::common::clock_fn_t clock_;
};

}  // namespace keyward::intent
