#include <keyward/common/critical.hpp>
#include <keyward/storage/rocksdb/storage.hpp>

namespace keyward::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  auto transaction_options = ROCKSDB_NAMESPACE::TransactionDBOptions{};

  ROCKSDB_NAMESPACE::TransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::TransactionDB::Open(
      options, transaction_options, std::string{path}, &database);
  if (!status.ok()) {
    detail::fail("Failed to open RocksDB at " + std::string{path}, status);
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::require_open() const {
  if (!database) {
    keyward::common::critical("RocksDB database is not initialized");
  }
}

bool storage<rocksdb_storage_tag>::put_if_absent_batch(
    const keyward::schema::bytes_view_t& guard_key,
    const keyward::schema::bytes_view_t& guard_value,
    const std::vector<key_value_entry_t>& entries) {
  require_open();
  for (auto attempt = 0; attempt < detail::kMaxTransactionAttempts;
       ++attempt) {
    auto transaction = std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{
        database->BeginTransaction(ROCKSDB_NAMESPACE::WriteOptions{})};

    auto existing = std::string{};
    auto status = transaction->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                            detail::to_slice(guard_key),
                                            &existing);
    if (detail::is_retryable(status)) {
      continue;
    }
    if (status.ok()) {
      return false;
    }
    if (!status.IsNotFound()) {
      detail::fail("Failed to lock guard key in RocksDB", status);
    }

    status = transaction->Put(detail::to_slice(guard_key),
                              detail::to_slice(guard_value));
    for (const auto& [key, value] : entries) {
      if (!status.ok()) {
        break;
      }
      status = transaction->Put(detail::to_slice(key), detail::to_slice(value));
    }
    if (status.ok()) {
      status = transaction->Commit();
    }
    if (status.ok()) {
      return true;
    }
    if (!detail::is_retryable(status)) {
      detail::fail("Failed to commit guarded batch", status);
    }
  }
  detail::fail("RocksDB transaction retries exhausted",
               ROCKSDB_NAMESPACE::Status::Busy());
}

void storage<rocksdb_storage_tag>::erase_and_put_batch(
    const keyward::schema::bytes_view_t& delete_key,
    const std::vector<key_value_entry_t>& entries) {
  require_open();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto status = batch.Delete(detail::to_slice(delete_key));
  for (const auto& [key, value] : entries) {
    if (!status.ok()) {
      break;
    }
    status = batch.Put(detail::to_slice(key), detail::to_slice(value));
  }
  if (status.ok()) {
    status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  }
  if (!status.ok()) {
    detail::fail("Failed to write RocksDB batch", status);
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const keyward::schema::bytes_view_t& prefix) const {
  require_open();

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    detail::fail("Failed to scan RocksDB prefix", iterator->status());
  }
  return entries;
}

}  // namespace keyward::storage
