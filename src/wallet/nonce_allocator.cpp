#include <keyward/common/signer_error.hpp>
#include <keyward/schema/key/nonce_record.hpp>
#include <keyward/wallet/nonce_allocator.hpp>

#include <spdlog/spdlog.h>

namespace keyward::wallet {

using namespace keyward::schema;

nonce_allocator::nonce_allocator(storage_t& storage, wallet_registry& registry)
    : storage_(storage), registry_(registry) {}

uint64_t nonce_allocator::allocate_and_increment(const hash32_t& wallet_id,
                                                 const chain_id_t chain_id) {
  auto encoder = encoder_t{};
  auto previous = storage_.read_modify_write<encoder_t, nonce_record_t>(
      encoder, key::make_key(wallet_id, chain_id),
      [&](const std::optional<nonce_record_t>& current) {
        if (!current) {
          return nonce_record_t{
              .wallet_id = wallet_id, .chain_id = chain_id, .next_nonce = 1};
        }
        auto next = *current;
        ++next.next_nonce;
        return next;
      });
  auto nonce = previous ? previous->next_nonce : uint64_t{0};
  spdlog::debug("Allocated nonce {} on chain {}", nonce, chain_id);
  return nonce;
}

uint64_t nonce_allocator::peek(const hash32_t& wallet_id,
                               const chain_id_t chain_id) {
  auto encoder = encoder_t{};
  auto record = storage_.get<encoder_t, nonce_record_t>(
      encoder, key::make_key(wallet_id, chain_id));
  return record ? record->next_nonce : 0;
}

void nonce_allocator::reset(const hash32_t& wallet_id,
                            const chain_id_t chain_id,
                            const uint64_t nonce) {
  auto encoder = encoder_t{};
  storage_.put(encoder, key::make_key(wallet_id, chain_id),
               nonce_record_t{
                   .wallet_id = wallet_id, .chain_id = chain_id,
                   .next_nonce = nonce});
  spdlog::info("Reset nonce on chain {} to {}", chain_id, nonce);
}

hash32_t nonce_allocator::resolve_owner(const std::string& owner) {
  auto wallet = registry_.get_by_owner(owner);
  if (!wallet) {
    throw keyward::common::signer_error{signer_error_code_t::no_wallet,
                                        "no automation wallet for " + owner};
  }
  return wallet->wallet_id;
}

uint64_t nonce_allocator::allocate_for_owner(const std::string& owner,
                                             const chain_id_t chain_id) {
  return allocate_and_increment(resolve_owner(owner), chain_id);
}

uint64_t nonce_allocator::peek_for_owner(const std::string& owner,
                                         const chain_id_t chain_id) {
  return peek(resolve_owner(owner), chain_id);
}

void nonce_allocator::reset_for_owner(const std::string& owner,
                                      const chain_id_t chain_id,
                                      const uint64_t nonce) {
  reset(resolve_owner(owner), chain_id, nonce);
}

}  // namespace keyward::wallet
