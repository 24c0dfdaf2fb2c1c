#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <keyward/common/signer_error.hpp>
#include <keyward/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace keyward::storage {

namespace detail {

inline constexpr auto kMaxTransactionAttempts = 64;

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const keyward::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline keyward::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline keyward::schema::bytes_view_t to_view(const std::string& value) {
  return keyward::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()};
}

/// Storage failures reach the caller, which decides whether to retry.
[[noreturn]] inline void fail(const std::string_view what,
                              const ROCKSDB_NAMESPACE::Status& status) {
  spdlog::error("{}: {}", what, status.ToString());
  throw keyward::common::signer_error{
      keyward::schema::signer_error_code_t::storage_unavailable,
      std::string{what} + ": " + status.ToString()};
}

/// Lock contention outcomes that a fresh transaction may resolve.
inline bool is_retryable(const ROCKSDB_NAMESPACE::Status& status) {
  return status.IsBusy() || status.IsTimedOut() || status.IsTryAgain();
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const keyward::schema::bytes_view_t& key);

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const keyward::schema::bytes_view_t& key,
           const T& value);

  template <typename Encoder, typename T>
  std::optional<T> read_modify_write(
      Encoder& encoder,
      const keyward::schema::bytes_view_t& key,
      const std::function<T(const std::optional<T>&)>& update);

  bool put_if_absent_batch(const keyward::schema::bytes_view_t& guard_key,
                           const keyward::schema::bytes_view_t& guard_value,
                           const std::vector<key_value_entry_t>& entries);

  void erase_and_put_batch(const keyward::schema::bytes_view_t& delete_key,
                           const std::vector<key_value_entry_t>& entries);

  std::vector<key_value_entry_t> list_by_prefix(
      const keyward::schema::bytes_view_t& prefix) const;

 private:
  void require_open() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const keyward::schema::bytes_view_t& key) {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    detail::fail("Failed to get value from RocksDB", status);
  }
  return {encoder.template decode<T>(detail::to_view(value))};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const keyward::schema::bytes_view_t& key,
                                       const T& value) {
  require_open();
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key),
                              detail::to_slice(encoded_value));
  if (!status.ok()) {
    detail::fail("Failed to put value into RocksDB", status);
  }
}

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::read_modify_write(
    Encoder& encoder,
    const keyward::schema::bytes_view_t& key,
    const std::function<T(const std::optional<T>&)>& update) {
  require_open();
  for (auto attempt = 0; attempt < detail::kMaxTransactionAttempts;
       ++attempt) {
    auto transaction = std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{
        database->BeginTransaction(ROCKSDB_NAMESPACE::WriteOptions{})};

    auto raw = std::string{};
    auto status = transaction->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                            detail::to_slice(key), &raw);
    if (detail::is_retryable(status)) {
      spdlog::debug("read_modify_write contention, attempt {}", attempt + 1);
      continue;
    }
    if (!status.ok() && !status.IsNotFound()) {
      detail::fail("Failed to lock value in RocksDB", status);
    }

    auto previous = std::optional<T>{};
    if (status.ok()) {
      previous = encoder.template decode<T>(detail::to_view(raw));
    }
    auto next = encoder.encode(update(previous));

    status = transaction->Put(detail::to_slice(key), detail::to_slice(next));
    if (status.ok()) {
      status = transaction->Commit();
    }
    if (status.ok()) {
      return previous;
    }
    if (!detail::is_retryable(status)) {
      detail::fail("Failed to commit RocksDB transaction", status);
    }
  }
  detail::fail("RocksDB transaction retries exhausted",
               ROCKSDB_NAMESPACE::Status::Busy());
}

}  // namespace keyward::storage
