#pragma once
#include <keyward/schema/primitives.hpp>
#include <string_view>

// Schema key type: local key material.
// Encrypted private keys of the local backend, keyed by key id.
namespace keyward::schema::key {

bytes_t make_local_key_key(const std::string_view& key_id);

}  // namespace keyward::schema::key
