#pragma once
#include <keyward/schema/key_provider.hpp>
#include <keyward/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: signing key.
// Opaque custody handle. The wallet address is derived once at creation and
// never changes afterwards.
namespace keyward::schema {

template <uint16_t Version>
struct signing_key;

template <>
struct signing_key<1> final {
  uint16_t version{1};
  std::string key_id;
  address_t wallet_address{};
  key_provider_t provider{key_provider_t::local};
  chain_family_t family{chain_family_t::evm};
  // Present only for key_provider_t::local.
  std::optional<std::string> encrypted_material;
  timestamp_milliseconds_t created_at{};
};

using signing_key_t = signing_key<1>;

}  // namespace keyward::schema
