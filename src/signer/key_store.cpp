#include <keyward/schema/key/signing_key.hpp>
#include <keyward/signer/key_store.hpp>

namespace keyward::signer {

void memory_key_store::save(const std::string& key_id,
                            const std::string& encrypted_material) {
  auto lock = std::scoped_lock{mutex_};
  records_[key_id] = encrypted_material;
}

std::optional<std::string> memory_key_store::load(const std::string& key_id) {
  auto lock = std::scoped_lock{mutex_};
  auto it = records_.find(key_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

storage_key_store::storage_key_store(storage_t& storage) : storage_(storage) {}

void storage_key_store::save(const std::string& key_id,
                             const std::string& encrypted_material) {
  auto encoder = encoder_t{};
  auto key = keyward::schema::key::make_local_key_key(key_id);
  storage_.put(encoder, key, encrypted_material);
}

std::optional<std::string> storage_key_store::load(const std::string& key_id) {
  auto encoder = encoder_t{};
  auto key = keyward::schema::key::make_local_key_key(key_id);
  return storage_.get<encoder_t, std::string>(encoder, key);
}

}  // namespace keyward::signer
