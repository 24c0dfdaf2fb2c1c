#include <gtest/gtest.h>
#include <keyward/evm/abi.hpp>
#include <keyward/evm/transaction_signer.hpp>
#include <keyward/signer/local_signer.hpp>
#include <keyward/testing/common.hpp>
#include <keyward/testing/errors.hpp>
#include <keyward/testing/random.hpp>

#include <csignal>

namespace {

using keyward::schema::signer_error_code_t;

/// Returns a fixed signature so encoding can be compared byte for byte.
class fixed_backend final : public keyward::signer::signing_backend {
 public:
  keyward::schema::signature_result_t result;
  keyward::schema::hash32_t last_digest{};

  keyward::schema::key_provider_t provider() const override {
    return keyward::schema::key_provider_t::local;
  }
  keyward::signer::key_creation_result_t create_key(const std::string&) override {
    return {};
  }
  keyward::schema::address_t get_address(const std::string&) override {
    return {};
  }
  keyward::schema::signature_result_t sign_hash(
      const std::string&,
      const keyward::schema::hash32_t& digest) override {
    last_digest = digest;
    return result;
  }
};

/// nonce 9, 20 gwei, 21000 gas, 1 ether to 0x3535..35 on mainnet.
keyward::evm::legacy_transaction_t make_reference_transaction() {
  auto tx = keyward::evm::legacy_transaction_t{};
  tx.nonce = 9;
  tx.gas_price = keyward::schema::amount_t{"20000000000"};
  tx.gas = 21000;
  tx.to = keyward::schema::make_address(
      "0x3535353535353535353535353535353535353535");
  tx.value = keyward::schema::amount_t{"1000000000000000000"};
  tx.chain_id = 1;
  return tx;
}

keyward::schema::signature_result_t make_reference_signature(const uint8_t v) {
  return keyward::schema::make_signature_result(
      keyward::schema::make_hash32(
          "28ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276"),
      keyward::schema::make_hash32(
          "67cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83"),
      v);
}

}  // namespace

TEST(transaction_signer, unsigned_payload_includes_chain_id) {
  auto tx = make_reference_transaction();
  EXPECT_EQ(keyward::schema::to_hex(keyward::evm::encode_unsigned(tx)),
            "ec098504a817c800825208943535353535353535353535353535353535353535"
            "880de0b6b3a764000080018080");
  EXPECT_EQ(keyward::schema::to_hex(keyward::schema::bytes_view_t{
                keyward::evm::signing_hash(tx)}),
            "daf5a779ae972f972197303d7b574746c7ef83eadac0f2791ad23db92e4c8e53");
}

TEST(transaction_signer, embeds_eip155_v) {
  auto backend = fixed_backend{};
  backend.result = make_reference_signature(27);
  auto tx = make_reference_transaction();

  auto signed_tx = keyward::evm::sign_legacy_transaction(tx, backend, "key");
  EXPECT_EQ(backend.last_digest, keyward::evm::signing_hash(tx));
  EXPECT_EQ(signed_tx.v, 37u);
  EXPECT_EQ(keyward::schema::to_hex(signed_tx.raw),
            "f86c098504a817c800825208943535353535353535353535353535353535353535"
            "880de0b6b3a76400008025a028ef61340bd939bc2195fe537567866003e1a15d3c"
            "71ff63e1590620aa636276a067cbe9d8997f761aecb703304b3800ccf555c9f3dc"
            "64214b297fb1966a3b6d83");
  EXPECT_EQ(keyward::schema::to_hex(keyward::schema::bytes_view_t{signed_tx.hash}),
            "33469b22e9f636356c4160a87eb19df52b7412e8eac32a4a55ffe88ea8350788");

  auto sender = keyward::evm::recover_sender(tx, signed_tx);
  ASSERT_TRUE(sender.has_value());
  EXPECT_EQ(keyward::schema::to_address_string(*sender),
            "0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f");
}

TEST(transaction_signer, recovery_id_one_and_other_chains) {
  auto backend = fixed_backend{};
  backend.result = make_reference_signature(28);
  auto tx = make_reference_transaction();
  EXPECT_EQ(keyward::evm::sign_legacy_transaction(tx, backend, "key").v, 38u);

  tx.chain_id = 137;
  EXPECT_EQ(keyward::evm::sign_legacy_transaction(tx, backend, "key").v, 310u);
}

TEST(transaction_signer, rejects_unexpected_backend_v) {
  auto backend = fixed_backend{};
  backend.result = make_reference_signature(0);
  auto tx = make_reference_transaction();
  EXPECT_EQ(keyward::testing::signer_error_code_of([&] {
              keyward::evm::sign_legacy_transaction(tx, backend, "key");
            }),
            signer_error_code_t::signing_failed);
}

TEST(transaction_signer, local_key_signs_recoverable_transaction) {
  auto random = keyward::testing::scripted_random_source{
      {keyward::schema::bytes_t(32, 0x46)}};
  auto store = keyward::signer::memory_key_store{};
  auto signer = keyward::signer::local_signer{keyward::testing::kMasterKeyHex,
                                              store, random};
  auto created = signer.create_key("label");
  EXPECT_EQ(keyward::schema::to_address_string(created.wallet_address),
            "0x9d8a62f656a8d1615c1294fd71e9cfb3e4855a4f");

  auto tx = make_reference_transaction();
  tx.chain_id = 8453;
  tx.to.reset();
  tx.value = 0;
  tx.data = keyward::evm::abi::encode_erc20_approve(
      keyward::schema::make_address(
          "0x3535353535353535353535353535353535353535"),
      1000000);

  auto signed_tx = keyward::evm::sign_legacy_transaction(tx, signer,
                                                         created.key_id);
  EXPECT_TRUE(signed_tx.v == 8453 * 2 + 35 || signed_tx.v == 8453 * 2 + 36);
  EXPECT_EQ(keyward::evm::recover_sender(tx, signed_tx),
            created.wallet_address);

  auto tampered = signed_tx;
  tampered.v = 27;
  EXPECT_FALSE(keyward::evm::recover_sender(tx, tampered).has_value());
}

TEST(transaction_signer, missing_nonce_is_fatal) {
  auto tx = make_reference_transaction();
  tx.nonce.reset();
  EXPECT_EXIT(keyward::evm::encode_unsigned(tx),
              ::testing::KilledBySignal(SIGTERM), "");
}
