#include <gtest/gtest.h>
#include <keyward/schema/encoding/scale/encoder.hpp>
#include <keyward/schema/nonce_record.hpp>
#include <keyward/storage/rocksdb/storage.hpp>
#include <keyward/storage/storage.hpp>
#include <keyward/testing/common.hpp>
#include <keyward/testing/errors.hpp>

#include <atomic>
#include <fstream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using storage_t =
    keyward::storage::storage<keyward::storage::rocksdb_storage_tag>;
using encoder_t = keyward::schema::encoding::encoder<
    keyward::schema::encoding::scale_encoder_tag>;

keyward::schema::bytes_t make_key(const std::string_view text) {
  return keyward::schema::make_bytes(text);
}

}  // namespace

TEST(storage, get_returns_nullopt_for_missing_key) {
  auto db = keyward::testing::make_db_path("keyward_storage_missing");
  {
    auto storage =
        keyward::storage::make_storage<keyward::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto value =
        storage.get<encoder_t, keyward::schema::nonce_record_t>(
            encoder, make_key("NONCE|missing"));
    EXPECT_FALSE(value.has_value());
  }
  keyward::testing::remove_path(db);
}

TEST(storage, put_then_get_round_trips) {
  auto db = keyward::testing::make_db_path("keyward_storage_put");
  {
    auto storage =
        keyward::storage::make_storage<keyward::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto record = keyward::schema::nonce_record_t{
        .wallet_id = keyward::testing::make_hash(3),
        .chain_id = 10,
        .next_nonce = 42};
    storage.put(encoder, make_key("NONCE|a"), record);

    auto loaded = storage.get<encoder_t, keyward::schema::nonce_record_t>(
        encoder, make_key("NONCE|a"));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->wallet_id, record.wallet_id);
    EXPECT_EQ(loaded->chain_id, 10u);
    EXPECT_EQ(loaded->next_nonce, 42u);
  }
  keyward::testing::remove_path(db);
}

TEST(storage, read_modify_write_returns_previous_value) {
  auto db = keyward::testing::make_db_path("keyward_storage_rmw");
  {
    auto storage =
        keyward::storage::make_storage<keyward::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = make_key("COUNTER|x");
    auto bump = [](const std::optional<uint64_t>& current) {
      return current.value_or(0) + 1;
    };

    auto first = storage.read_modify_write<encoder_t, uint64_t>(encoder, key,
                                                                bump);
    auto second = storage.read_modify_write<encoder_t, uint64_t>(encoder, key,
                                                                 bump);
    EXPECT_FALSE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, 1u);
    EXPECT_EQ((storage.get<encoder_t, uint64_t>(encoder, key)), 2u);
  }
  keyward::testing::remove_path(db);
}

TEST(storage, read_modify_write_serializes_threads) {
  auto db = keyward::testing::make_db_path("keyward_storage_threads");
  {
    auto storage =
        keyward::storage::make_storage<keyward::storage::rocksdb_storage_tag>(db);
    auto key = make_key("COUNTER|threads");
    constexpr auto kThreads = 8;
    constexpr auto kIncrements = 25;

    auto workers = std::vector<std::thread>{};
    for (auto t = 0; t < kThreads; ++t) {
      workers.emplace_back([&] {
        auto encoder = encoder_t{};
        for (auto i = 0; i < kIncrements; ++i) {
          storage.read_modify_write<encoder_t, uint64_t>(
              encoder, key, [](const std::optional<uint64_t>& current) {
                return current.value_or(0) + 1;
              });
        }
      });
    }
    for (auto& worker : workers) {
      worker.join();
    }

    auto encoder = encoder_t{};
    EXPECT_EQ((storage.get<encoder_t, uint64_t>(encoder, key)),
              uint64_t{kThreads * kIncrements});
  }
  keyward::testing::remove_path(db);
}

TEST(storage, put_if_absent_batch_writes_once) {
  auto db = keyward::testing::make_db_path("keyward_storage_guard");
  {
    auto storage =
        keyward::storage::make_storage<keyward::storage::rocksdb_storage_tag>(db);
    auto guard = make_key("GUARD|1");
    auto value = keyward::schema::bytes_t{0x01};

    EXPECT_TRUE(storage.put_if_absent_batch(
        guard, value, {{make_key("DATA|1"), keyward::schema::bytes_t{0xAA}}}));
    EXPECT_FALSE(storage.put_if_absent_batch(
        guard, value, {{make_key("DATA|2"), keyward::schema::bytes_t{0xBB}}}));

    auto entries = storage.list_by_prefix(make_key("DATA|"));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, make_key("DATA|1"));
    EXPECT_EQ(entries[0].second, keyward::schema::bytes_t{0xAA});
  }
  keyward::testing::remove_path(db);
}

TEST(storage, put_if_absent_batch_has_one_winner) {
  auto db = keyward::testing::make_db_path("keyward_storage_race");
  {
    auto storage =
        keyward::storage::make_storage<keyward::storage::rocksdb_storage_tag>(db);
    auto guard = make_key("GUARD|race");
    auto winners = std::atomic<int>{0};

    auto workers = std::vector<std::thread>{};
    for (auto t = 0; t < 8; ++t) {
      workers.emplace_back([&, t] {
        auto value = keyward::schema::bytes_t{static_cast<uint8_t>(t)};
        if (storage.put_if_absent_batch(guard, value, {})) {
          ++winners;
        }
      });
    }
    for (auto& worker : workers) {
      worker.join();
    }
    EXPECT_EQ(winners.load(), 1);
  }
  keyward::testing::remove_path(db);
}

TEST(storage, erase_and_put_batch_is_atomic) {
  auto db = keyward::testing::make_db_path("keyward_storage_erase");
  {
    auto storage =
        keyward::storage::make_storage<keyward::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    storage.put(encoder, make_key("SLOT|a"), uint64_t{1});

    storage.erase_and_put_batch(make_key("SLOT|a"),
                                {{make_key("RECORD|a"), encoder.encode(uint64_t{2})}});

    EXPECT_FALSE(
        (storage.get<encoder_t, uint64_t>(encoder, make_key("SLOT|a")))
            .has_value());
    EXPECT_EQ((storage.get<encoder_t, uint64_t>(encoder, make_key("RECORD|a"))),
              2u);
  }
  keyward::testing::remove_path(db);
}

TEST(storage, list_by_prefix_stops_at_prefix_boundary) {
  auto db = keyward::testing::make_db_path("keyward_storage_prefix");
  {
    auto storage =
        keyward::storage::make_storage<keyward::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    storage.put(encoder, make_key("WALLET|1"), uint64_t{1});
    storage.put(encoder, make_key("WALLET|2"), uint64_t{2});
    storage.put(encoder, make_key("WALLET_ADDR|1"), uint64_t{3});
    storage.put(encoder, make_key("ZZZ"), uint64_t{4});

    auto entries = storage.list_by_prefix(make_key("WALLET|"));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, make_key("WALLET|1"));
    EXPECT_EQ(entries[1].first, make_key("WALLET|2"));
  }
  keyward::testing::remove_path(db);
}

TEST(storage, open_failure_is_reported_to_caller) {
  auto db = keyward::testing::make_db_path("keyward_storage_locked");
  {
    auto storage =
        keyward::storage::make_storage<keyward::storage::rocksdb_storage_tag>(db);
    // The first handle holds the database lock.
    EXPECT_EQ(keyward::testing::signer_error_code_of([&] {
                keyward::storage::make_storage<
                    keyward::storage::rocksdb_storage_tag>(db);
              }),
              keyward::schema::signer_error_code_t::storage_unavailable);
  }
  keyward::testing::remove_path(db);

  auto file = keyward::testing::make_db_path("keyward_storage_file");
  std::ofstream{file} << "not a database";
  EXPECT_EQ(keyward::testing::signer_error_code_of([&] {
              keyward::storage::make_storage<
                  keyward::storage::rocksdb_storage_tag>(file);
            }),
            keyward::schema::signer_error_code_t::storage_unavailable);
  keyward::testing::remove_path(file);
}
