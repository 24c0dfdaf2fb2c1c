#pragma once
#include <keyward/schema/primitives.hpp>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace keyward::storage {

using key_value_entry_t =
    std::pair<keyward::schema::bytes_t, keyward::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const keyward::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const keyward::schema::bytes_view_t& key,
           const T& value);

  /// Atomically read the value at key, apply update and persist the result.
  /// Concurrent writers on the same key are serialized by the backend.
  /// Returns the value observed before the update.
  template <typename Encoder, typename T>
  std::optional<T> read_modify_write(
      Encoder& encoder,
      const keyward::schema::bytes_view_t& key,
      const std::function<T(const std::optional<T>&)>& update);

  /// Atomically write entries only when guard_key is absent. guard_key is
  /// written with guard_value in the same commit. Returns false when the guard
  /// already exists and nothing was written.
  bool put_if_absent_batch(const keyward::schema::bytes_view_t& guard_key,
                           const keyward::schema::bytes_view_t& guard_value,
                           const std::vector<key_value_entry_t>& entries);

  /// Atomically delete delete_key and write entries.
  void erase_and_put_batch(const keyward::schema::bytes_view_t& delete_key,
                           const std::vector<key_value_entry_t>& entries);

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const keyward::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace keyward::storage
