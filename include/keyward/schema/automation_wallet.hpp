#pragma once
#include <keyward/schema/primitives.hpp>
#include <keyward/schema/signing_key.hpp>
#include <keyward/schema/wallet_purpose.hpp>
#include <optional>
#include <string>

// Schema type: automation wallet.
// An owner's automation identity. It owns exactly one signing key and is
// deactivated, never deleted.
namespace keyward::schema {

inline constexpr auto kDefaultWalletLabel =
    std::string_view{"Position Automation Wallet"};

template <uint16_t Version>
struct automation_wallet;

template <>
struct automation_wallet<1> final {
  uint16_t version{1};
  hash32_t wallet_id{};
  std::string owner;
  wallet_purpose_t purpose{automation_purpose{}};
  std::string label;
  signing_key_t signing_key;
  bool is_active{true};
  timestamp_milliseconds_t created_at{};
  std::optional<timestamp_milliseconds_t> last_used_at;
};

using automation_wallet_t = automation_wallet<1>;

}  // namespace keyward::schema
