#include <gtest/gtest.h>
#include <keyward/schema/encoding/scale/encoder.hpp>
#include <keyward/schema/key/automation_wallet.hpp>
#include <keyward/schema/key/nonce_record.hpp>
#include <keyward/testing/common.hpp>

namespace {

using encoder_t = keyward::schema::encoding::encoder<
    keyward::schema::encoding::scale_encoder_tag>;

keyward::schema::automation_wallet_t make_wallet() {
  auto wallet = keyward::schema::automation_wallet_t{};
  wallet.wallet_id = keyward::testing::make_hash(3);
  wallet.owner = "user-1";
  wallet.purpose = keyward::schema::strategy_purpose{.strategy_id = "grid-7"};
  wallet.label = "Grid wallet";
  wallet.signing_key.key_id = "hsm-key-1";
  wallet.signing_key.wallet_address[0] = 0xAA;
  wallet.signing_key.provider = keyward::schema::key_provider_t::managed_hsm;
  wallet.signing_key.created_at = 1700000000000;
  wallet.is_active = false;
  wallet.created_at = 1700000000000;
  wallet.last_used_at = 1700000001000;
  return wallet;
}

}  // namespace

TEST(scale_encoding, automation_wallet_keeps_purpose_and_optionals) {
  auto encoder = encoder_t{};
  auto wallet = make_wallet();
  auto decoded =
      encoder.decode<keyward::schema::automation_wallet_t>(encoder.encode(wallet));

  EXPECT_EQ(decoded.wallet_id, wallet.wallet_id);
  EXPECT_EQ(decoded.owner, wallet.owner);
  EXPECT_EQ(decoded.purpose, wallet.purpose);
  EXPECT_EQ(decoded.signing_key.key_id, wallet.signing_key.key_id);
  EXPECT_EQ(decoded.signing_key.provider,
            keyward::schema::key_provider_t::managed_hsm);
  EXPECT_FALSE(decoded.signing_key.encrypted_material.has_value());
  EXPECT_FALSE(decoded.is_active);
  EXPECT_EQ(decoded.last_used_at, wallet.last_used_at);
}

TEST(scale_encoding, truncated_record_is_rejected) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(make_wallet());
  bytes.resize(bytes.size() / 2);
  EXPECT_FALSE(
      encoder.try_decode<keyward::schema::automation_wallet_t>(bytes).has_value());
}

TEST(storage_keys, owner_key_separates_purposes) {
  auto automation = keyward::schema::key::make_owner_key(
      "user-1", keyward::schema::automation_purpose{});
  auto strategy = keyward::schema::key::make_owner_key(
      "user-1", keyward::schema::strategy_purpose{.strategy_id = "grid-7"});
  auto other = keyward::schema::key::make_owner_key(
      "user-1", keyward::schema::strategy_purpose{.strategy_id = "grid-8"});
  EXPECT_NE(automation, strategy);
  EXPECT_NE(strategy, other);
}

TEST(storage_keys, nonce_key_separates_chains) {
  auto wallet_id = keyward::testing::make_hash(1);
  EXPECT_NE(keyward::schema::key::make_key(wallet_id, 1),
            keyward::schema::key::make_key(wallet_id, 10));
}
