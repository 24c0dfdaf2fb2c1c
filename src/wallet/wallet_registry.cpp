#include <keyward/blake3/hash.hpp>
#include <keyward/common/signer_error.hpp>
#include <keyward/schema/key/automation_wallet.hpp>
#include <keyward/wallet/wallet_registry.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace keyward::wallet {

using namespace keyward::schema;
using keyward::common::signer_error;

hash32_t make_wallet_id(const wallet_purpose_t& purpose,
                        const address_t& address) {
  return keyward::blake3::hash(std::string{"evm/"} +
                               std::string{purpose_name(purpose)} + "/" +
                               to_address_string(address));
}

wallet_registry::wallet_registry(storage_t& storage,
                                 keyward::signer::signing_backend& backend,
                                 keyward::common::clock_fn_t clock)
    : storage_(storage), backend_(backend), clock_(std::move(clock)) {}

automation_wallet_t wallet_registry::create(const std::string& owner,
                                            const wallet_purpose_t& purpose,
                                            const std::string& label) {
  if (owner.empty()) {
    throw signer_error{signer_error_code_t::invalid_argument,
                       "wallet owner must not be empty"};
  }
  auto encoder = encoder_t{};
  auto owner_key = key::make_owner_key(owner, purpose);
  if (storage_.get<encoder_t, hash32_t>(encoder, owner_key)) {
    throw signer_error{signer_error_code_t::wallet_exists,
                       "wallet already exists for " + owner};
  }

  auto created = backend_.create_key(owner + ":" + label);
  auto now = clock_();

  auto wallet = automation_wallet_t{};
  wallet.wallet_id = make_wallet_id(purpose, created.wallet_address);
  wallet.owner = owner;
  wallet.purpose = purpose;
  wallet.label = label;
  wallet.signing_key.key_id = created.key_id;
  wallet.signing_key.wallet_address = created.wallet_address;
  wallet.signing_key.provider = backend_.provider();
  wallet.signing_key.family = chain_family_t::evm;
  wallet.signing_key.encrypted_material = created.encrypted_material;
  wallet.signing_key.created_at = now;
  wallet.is_active = true;
  wallet.created_at = now;

  auto wallet_id_bytes = encoder.encode(wallet.wallet_id);
  auto entries = std::vector<keyward::storage::key_value_entry_t>{
      {key::make_wallet_key(wallet.wallet_id), encoder.encode(wallet)},
      {key::make_address_key(created.wallet_address), wallet_id_bytes}};
  if (!storage_.put_if_absent_batch(owner_key, wallet_id_bytes, entries)) {
    spdlog::warn("Concurrent wallet creation for {}; key {} left unused",
                 owner, created.key_id);
    throw signer_error{signer_error_code_t::wallet_exists,
                       "wallet already exists for " + owner};
  }

  spdlog::info("Created {} wallet {} for {}", purpose_name(purpose),
               to_address_string(created.wallet_address), owner);
  return wallet;
}

std::optional<automation_wallet_t> wallet_registry::get_by_owner(
    const std::string& owner,
    const wallet_purpose_t& purpose) {
  auto encoder = encoder_t{};
  auto wallet_id = storage_.get<encoder_t, hash32_t>(
      encoder, key::make_owner_key(owner, purpose));
  if (!wallet_id) {
    return std::nullopt;
  }
  auto wallet = get_by_id(*wallet_id);
  if (!wallet || !wallet->is_active) {
    return std::nullopt;
  }
  return wallet;
}

std::optional<automation_wallet_t> wallet_registry::get_by_address(
    const address_t& address) {
  auto encoder = encoder_t{};
  auto wallet_id = storage_.get<encoder_t, hash32_t>(
      encoder, key::make_address_key(address));
  if (!wallet_id) {
    return std::nullopt;
  }
  return get_by_id(*wallet_id);
}

std::optional<automation_wallet_t> wallet_registry::get_by_id(
    const hash32_t& wallet_id) {
  auto encoder = encoder_t{};
  return storage_.get<encoder_t, automation_wallet_t>(
      encoder, key::make_wallet_key(wallet_id));
}

std::vector<automation_wallet_t> wallet_registry::list_by_owner(
    const std::string& owner) {
  auto encoder = encoder_t{};
  auto wallets = std::vector<automation_wallet_t>{};
  auto prefix = make_bytes(std::string_view{"WALLET|"});
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    auto wallet = encoder.decode<automation_wallet_t>(value);
    if (wallet.owner == owner) {
      wallets.push_back(std::move(wallet));
    }
  }
  return wallets;
}

bool wallet_registry::deactivate(const std::string& owner,
                                 const wallet_purpose_t& purpose) {
  auto wallet = get_by_owner(owner, purpose);
  if (!wallet) {
    return false;
  }
  wallet->is_active = false;

  auto encoder = encoder_t{};
  storage_.erase_and_put_batch(
      key::make_owner_key(owner, purpose),
      {{key::make_wallet_key(wallet->wallet_id), encoder.encode(*wallet)}});
  spdlog::info("Deactivated {} wallet {} for {}", purpose_name(purpose),
               to_address_string(wallet->signing_key.wallet_address), owner);
  return true;
}

automation_wallet_t wallet_registry::get_or_create(
    const std::string& owner,
    const wallet_purpose_t& purpose,
    const std::string& label) {
  if (auto existing = get_by_owner(owner, purpose)) {
    return *existing;
  }
  try {
    return create(owner, purpose, label);
  } catch (const signer_error& e) {
    if (e.code() != signer_error_code_t::wallet_exists) {
      throw;
    }
    auto winner = get_by_owner(owner, purpose);
    if (!winner) {
      throw;
    }
    return *winner;
  }
}

bool wallet_registry::touch(const hash32_t& wallet_id) {
  auto encoder = encoder_t{};
  auto key = key::make_wallet_key(wallet_id);
  auto existing = storage_.get<encoder_t, automation_wallet_t>(encoder, key);
  if (!existing) {
    return false;
  }
  auto now = clock_();
  storage_.read_modify_write<encoder_t, automation_wallet_t>(
      encoder, key,
      [&](const std::optional<automation_wallet_t>& current) {
        auto next = current.value_or(*existing);
        next.last_used_at = now;
        return next;
      });
  return true;
}

signature_result_t wallet_registry::sign_hash_for(
    const std::string& owner,
    const wallet_purpose_t& purpose,
    const hash32_t& digest) {
  auto wallet = get_by_owner(owner, purpose);
  if (!wallet) {
    throw signer_error{signer_error_code_t::wallet_not_found,
                       "no active " + std::string{purpose_name(purpose)} +
                           " wallet for " + owner};
  }
  auto signature = backend_.sign_hash(wallet->signing_key.key_id, digest);
  touch(wallet->wallet_id);
  spdlog::debug("Signed digest with wallet {}",
                to_address_string(wallet->signing_key.wallet_address));
  return signature;
}

}  // namespace keyward::wallet
