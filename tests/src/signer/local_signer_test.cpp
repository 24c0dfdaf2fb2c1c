#include <gtest/gtest.h>
#include <keyward/crypto/secp256k1.hpp>
#include <keyward/signer/local_signer.hpp>
#include <keyward/storage/rocksdb/storage.hpp>
#include <keyward/testing/common.hpp>
#include <keyward/testing/errors.hpp>
#include <keyward/testing/random.hpp>

#include <algorithm>
#include <string>

namespace {

using keyward::schema::signer_error_code_t;
using keyward::testing::signer_error_code_of;

keyward::schema::bytes_t scalar_bytes(const uint64_t value) {
  auto scalar = keyward::testing::make_scalar(value);
  return {scalar.begin(), scalar.end()};
}

}  // namespace

TEST(local_signer, created_key_address_matches_private_key) {
  auto random = keyward::testing::scripted_random_source{
      {scalar_bytes(1), keyward::schema::bytes_t(16, 0xAB)}};
  auto store = keyward::signer::memory_key_store{};
  auto signer = keyward::signer::local_signer{keyward::testing::kMasterKeyHex,
                                              store, random};

  auto created = signer.create_key("owner-1:default");
  EXPECT_EQ(created.key_id, "local-abababababababababababababababab");
  EXPECT_EQ(keyward::schema::to_address_string(created.wallet_address),
            "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
  ASSERT_TRUE(created.encrypted_material.has_value());
  EXPECT_EQ(store.load(created.key_id), created.encrypted_material);
  EXPECT_EQ(signer.get_address(created.key_id), created.wallet_address);
  EXPECT_EQ(signer.provider(), keyward::schema::key_provider_t::local);
}

TEST(local_signer, stored_material_is_not_plaintext) {
  auto random = keyward::testing::scripted_random_source{{scalar_bytes(1)}};
  auto store = keyward::signer::memory_key_store{};
  auto signer = keyward::signer::local_signer{keyward::testing::kMasterKeyHex,
                                              store, random};

  auto created = signer.create_key("label");
  auto record = store.load(created.key_id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->find(keyward::schema::to_hex(scalar_bytes(1))),
            std::string::npos);
}

TEST(local_signer, rejects_out_of_range_draws) {
  auto random = keyward::testing::scripted_random_source{
      {keyward::schema::bytes_t(32, 0x00), keyward::schema::bytes_t(32, 0xFF),
       scalar_bytes(2)}};
  auto store = keyward::signer::memory_key_store{};
  auto signer = keyward::signer::local_signer{keyward::testing::kMasterKeyHex,
                                              store, random};

  auto created = signer.create_key("label");
  EXPECT_EQ(keyward::schema::to_address_string(created.wallet_address),
            "0x2b5ad5c4795c026514f8317c7a215e218dccd6cf");
}

TEST(local_signer, signature_recovers_to_wallet_address) {
  auto random = keyward::testing::scripted_random_source{};
  auto store = keyward::signer::memory_key_store{};
  auto signer = keyward::signer::local_signer{keyward::testing::kMasterKeyHex,
                                              store, random};
  auto created = signer.create_key("label");

  for (auto seed : {uint8_t{0}, uint8_t{1}, uint8_t{99}}) {
    auto digest = keyward::testing::make_hash(seed);
    auto result = signer.sign_hash(created.key_id, digest);
    EXPECT_TRUE(result.v == 27 || result.v == 28);
    EXPECT_TRUE(keyward::crypto::is_low_s(result.s));
    EXPECT_EQ(result.signature[64], result.v);
    EXPECT_TRUE(std::equal(result.r.begin(), result.r.end(),
                           result.signature.begin()));

    auto recovered = keyward::crypto::recover_address(
        digest, keyward::schema::bytes_view_t{result.signature});
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, created.wallet_address);
  }
}

TEST(local_signer, v_carries_recovery_id_of_signature) {
  auto random = keyward::testing::scripted_random_source{};
  auto scalar = keyward::testing::make_scalar(0xC0FFEE);
  random.push({scalar.begin(), scalar.end()});
  auto store = keyward::signer::memory_key_store{};
  auto signer = keyward::signer::local_signer{keyward::testing::kMasterKeyHex,
                                              store, random};
  auto created = signer.create_key("label");

  auto digest = keyward::testing::make_hash(42);
  auto expected = keyward::crypto::sign_recoverable(scalar, digest);
  ASSERT_TRUE(expected.has_value());

  auto result = signer.sign_hash(created.key_id, digest);
  EXPECT_EQ(result.r, expected->signature.r);
  EXPECT_EQ(result.s, expected->signature.s);
  EXPECT_EQ(result.v, 27 + expected->recovery_id);
}

TEST(local_signer, typed_data_and_transaction_paths_sign_raw_digest) {
  auto random = keyward::testing::scripted_random_source{};
  auto store = keyward::signer::memory_key_store{};
  auto signer = keyward::signer::local_signer{keyward::testing::kMasterKeyHex,
                                              store, random};
  auto created = signer.create_key("label");
  auto digest = keyward::testing::make_hash(5);

  auto typed = signer.sign_typed_data_hash(created.key_id, digest);
  auto transaction = signer.sign_transaction(created.key_id, digest);
  EXPECT_EQ(keyward::crypto::recover_address(
                digest, keyward::schema::bytes_view_t{typed.signature}),
            created.wallet_address);
  EXPECT_EQ(keyward::crypto::recover_address(
                digest, keyward::schema::bytes_view_t{transaction.signature}),
            created.wallet_address);
}

TEST(local_signer, unknown_key_is_reported) {
  auto random = keyward::testing::scripted_random_source{};
  auto store = keyward::signer::memory_key_store{};
  auto signer = keyward::signer::local_signer{keyward::testing::kMasterKeyHex,
                                              store, random};

  EXPECT_EQ(signer_error_code_of([&] {
              signer.sign_hash("local-missing", keyward::testing::make_hash(1));
            }),
            signer_error_code_t::key_not_found);
  EXPECT_EQ(signer_error_code_of([&] { signer.get_address("local-missing"); }),
            signer_error_code_t::key_not_found);
}

TEST(local_signer, corrupt_record_fails_signing) {
  auto random = keyward::testing::scripted_random_source{};
  auto store = keyward::signer::memory_key_store{};
  auto signer = keyward::signer::local_signer{keyward::testing::kMasterKeyHex,
                                              store, random};
  store.save("local-corrupt", "AAAA:AAAA:AAAA");

  EXPECT_EQ(signer_error_code_of([&] {
              signer.sign_hash("local-corrupt", keyward::testing::make_hash(1));
            }),
            signer_error_code_t::signing_failed);
}

TEST(local_signer, master_secret_is_required) {
  auto random = keyward::testing::scripted_random_source{};
  auto store = keyward::signer::memory_key_store{};
  EXPECT_EQ(signer_error_code_of([&] {
              keyward::signer::local_signer{"", store, random};
            }),
            signer_error_code_t::configuration_error);
  EXPECT_EQ(signer_error_code_of([&] {
              keyward::signer::local_signer{"0011", store, random};
            }),
            signer_error_code_t::configuration_error);
}

TEST(local_signer, keys_survive_restart_through_storage) {
  auto db = keyward::testing::make_db_path("keyward_local_signer");
  auto key_id = std::string{};
  auto address = keyward::schema::address_t{};
  {
    auto storage =
        keyward::storage::make_storage<keyward::storage::rocksdb_storage_tag>(db);
    auto store = keyward::signer::storage_key_store{storage};
    auto random = keyward::testing::scripted_random_source{};
    auto signer = keyward::signer::local_signer{
        keyward::testing::kMasterKeyHex, store, random};
    auto created = signer.create_key("label");
    key_id = created.key_id;
    address = created.wallet_address;
  }
  {
    auto storage =
        keyward::storage::make_storage<keyward::storage::rocksdb_storage_tag>(db);
    auto store = keyward::signer::storage_key_store{storage};
    auto random = keyward::testing::scripted_random_source{};
    auto signer = keyward::signer::local_signer{
        keyward::testing::kMasterKeyHex, store, random};

    EXPECT_EQ(signer.get_address(key_id), address);
    auto digest = keyward::testing::make_hash(3);
    auto result = signer.sign_hash(key_id, digest);
    EXPECT_EQ(keyward::crypto::recover_address(
                  digest, keyward::schema::bytes_view_t{result.signature}),
              address);
  }
  keyward::testing::remove_path(db);
}
