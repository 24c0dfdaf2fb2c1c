#include <gtest/gtest.h>
#include <keyward/signer/local_signer.hpp>
#include <keyward/storage/rocksdb/storage.hpp>
#include <keyward/testing/common.hpp>
#include <keyward/testing/errors.hpp>
#include <keyward/testing/random.hpp>
#include <keyward/wallet/nonce_allocator.hpp>
#include <keyward/wallet/wallet_registry.hpp>

#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace {

using keyward::schema::signer_error_code_t;
using keyward::testing::signer_error_code_of;

class nonce_allocator_fixture : public ::testing::Test {
 protected:
  using storage_t =
      keyward::storage::storage<keyward::storage::rocksdb_storage_tag>;

  void SetUp() override {
    db_ = keyward::testing::make_db_path("keyward_nonce_allocator");
    storage_ = std::make_unique<storage_t>(
        keyward::storage::make_storage<keyward::storage::rocksdb_storage_tag>(
            db_));
    backend_ = std::make_unique<keyward::signer::local_signer>(
        keyward::testing::kMasterKeyHex, store_, random_);
    registry_ =
        std::make_unique<keyward::wallet::wallet_registry>(*storage_, *backend_);
    nonces_ = std::make_unique<keyward::wallet::nonce_allocator>(*storage_,
                                                                 *registry_);
  }

  void TearDown() override {
    nonces_.reset();
    registry_.reset();
    storage_.reset();
    keyward::testing::remove_path(db_);
  }

  std::string db_;
  keyward::testing::scripted_random_source random_;
  keyward::signer::memory_key_store store_;
  std::unique_ptr<storage_t> storage_;
  std::unique_ptr<keyward::signer::local_signer> backend_;
  std::unique_ptr<keyward::wallet::wallet_registry> registry_;
  std::unique_ptr<keyward::wallet::nonce_allocator> nonces_;
};

}  // namespace

TEST_F(nonce_allocator_fixture, allocates_sequentially_from_zero) {
  auto wallet_id = keyward::testing::make_hash(1);
  EXPECT_EQ(nonces_->peek(wallet_id, 1), 0u);
  for (auto expected = uint64_t{0}; expected < 5; ++expected) {
    EXPECT_EQ(nonces_->allocate_and_increment(wallet_id, 1), expected);
  }
  EXPECT_EQ(nonces_->peek(wallet_id, 1), 5u);
}

TEST_F(nonce_allocator_fixture, counters_are_per_wallet_and_chain) {
  auto first = keyward::testing::make_hash(1);
  auto second = keyward::testing::make_hash(2);
  nonces_->allocate_and_increment(first, 1);
  nonces_->allocate_and_increment(first, 1);

  EXPECT_EQ(nonces_->allocate_and_increment(first, 10), 0u);
  EXPECT_EQ(nonces_->allocate_and_increment(second, 1), 0u);
  EXPECT_EQ(nonces_->peek(first, 1), 2u);
}

TEST_F(nonce_allocator_fixture, concurrent_allocations_are_unique) {
  auto wallet_id = keyward::testing::make_hash(7);
  constexpr auto kThreads = 8;
  constexpr auto kPerThread = 20;

  auto mutex = std::mutex{};
  auto seen = std::set<uint64_t>{};
  auto workers = std::vector<std::thread>{};
  for (auto t = 0; t < kThreads; ++t) {
    workers.emplace_back([&] {
      for (auto i = 0; i < kPerThread; ++i) {
        auto nonce = nonces_->allocate_and_increment(wallet_id, 1);
        auto lock = std::scoped_lock{mutex};
        seen.insert(nonce);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  ASSERT_EQ(seen.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(*seen.begin(), 0u);
  EXPECT_EQ(*seen.rbegin(), static_cast<uint64_t>(kThreads * kPerThread - 1));
  EXPECT_EQ(nonces_->peek(wallet_id, 1),
            static_cast<uint64_t>(kThreads * kPerThread));
}

TEST_F(nonce_allocator_fixture, reset_overrides_counter) {
  auto wallet_id = keyward::testing::make_hash(3);
  nonces_->allocate_and_increment(wallet_id, 1);
  nonces_->reset(wallet_id, 1, 5);
  EXPECT_EQ(nonces_->peek(wallet_id, 1), 5u);
  EXPECT_EQ(nonces_->allocate_and_increment(wallet_id, 1), 5u);
  EXPECT_EQ(nonces_->allocate_and_increment(wallet_id, 1), 6u);

  nonces_->reset(wallet_id, 1, 0);
  EXPECT_EQ(nonces_->allocate_and_increment(wallet_id, 1), 0u);
}

TEST_F(nonce_allocator_fixture, owner_variants_resolve_wallet) {
  auto wallet =
      registry_->create("owner-1", keyward::schema::automation_purpose{});
  EXPECT_EQ(nonces_->allocate_for_owner("owner-1", 137), 0u);
  EXPECT_EQ(nonces_->allocate_for_owner("owner-1", 137), 1u);
  EXPECT_EQ(nonces_->peek(wallet.wallet_id, 137), 2u);

  nonces_->reset_for_owner("owner-1", 137, 40);
  EXPECT_EQ(nonces_->peek_for_owner("owner-1", 137), 40u);
}

TEST_F(nonce_allocator_fixture, owner_without_wallet_is_reported) {
  EXPECT_EQ(signer_error_code_of(
                [&] { nonces_->allocate_for_owner("nobody", 1); }),
            signer_error_code_t::no_wallet);
  EXPECT_EQ(signer_error_code_of([&] { nonces_->peek_for_owner("nobody", 1); }),
            signer_error_code_t::no_wallet);

  registry_->create("owner-1", keyward::schema::automation_purpose{});
  registry_->deactivate("owner-1");
  EXPECT_EQ(signer_error_code_of(
                [&] { nonces_->reset_for_owner("owner-1", 1, 3); }),
            signer_error_code_t::no_wallet);
}
