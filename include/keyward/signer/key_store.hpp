#pragma once

#include <keyward/schema/encoding/scale/encoder.hpp>
#include <keyward/storage/rocksdb/storage.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace keyward::signer {

/// Persistence port for encrypted local key material. Implementations only
/// ever see ciphertext records.
struct key_store {
  virtual ~key_store() = default;

  virtual void save(const std::string& key_id,
                    const std::string& encrypted_material) = 0;
  virtual std::optional<std::string> load(const std::string& key_id) = 0;
};

/// Process local store for tests and throwaway development runs.
class memory_key_store final : public key_store {
 public:
  void save(const std::string& key_id,
            const std::string& encrypted_material) override;
  std::optional<std::string> load(const std::string& key_id) override;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> records_;
};

/// RocksDB backed store under the LOCAL_KEY| keyspace.
class storage_key_store final : public key_store {
 public:
  using storage_t =
      keyward::storage::storage<keyward::storage::rocksdb_storage_tag>;

  explicit storage_key_store(storage_t& storage);

  void save(const std::string& key_id,
            const std::string& encrypted_material) override;
  std::optional<std::string> load(const std::string& key_id) override;

 private:
  using encoder_t = keyward::schema::encoding::encoder<
      keyward::schema::encoding::scale_encoder_tag>;

  storage_t& storage_;
};

}  // namespace keyward::signer
