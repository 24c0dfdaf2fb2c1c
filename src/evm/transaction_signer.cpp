#include <keyward/common/critical.hpp>
#include <keyward/common/signer_error.hpp>
#include <keyward/crypto/secp256k1.hpp>
#include <keyward/evm/rlp.hpp>
#include <keyward/evm/transaction_signer.hpp>
#include <keyward/keccak/hash.hpp>

#include <spdlog/spdlog.h>

#include <vector>

namespace keyward::evm {

using namespace keyward::schema;

namespace {

void require_fields(const legacy_transaction_t& tx) {
  if (!tx.nonce) {
    keyward::common::critical("legacy transaction is missing nonce");
  }
  if (!tx.gas_price) {
    keyward::common::critical("legacy transaction is missing gas price");
  }
  if (!tx.gas) {
    keyward::common::critical("legacy transaction is missing gas limit");
  }
  if (!tx.chain_id) {
    keyward::common::critical("legacy transaction is missing chain id");
  }
}

std::vector<bytes_t> encode_body(const legacy_transaction_t& tx) {
  require_fields(tx);
  auto to = bytes_t{};
  if (tx.to) {
    to.assign(tx.to->begin(), tx.to->end());
  }
  return {rlp::encode_integer(*tx.nonce),
          rlp::encode_integer(*tx.gas_price),
          rlp::encode_integer(*tx.gas),
          rlp::encode_string(to),
          rlp::encode_integer(tx.value),
          rlp::encode_string(tx.data)};
}

amount_t word_to_integer(const hash32_t& word) {
  return from_big_endian(word);
}

}  // namespace

bytes_t encode_unsigned(const legacy_transaction_t& tx) {
  auto items = encode_body(tx);
  items.push_back(rlp::encode_integer(*tx.chain_id));
  items.push_back(rlp::encode_integer(0));
  items.push_back(rlp::encode_integer(0));
  return rlp::encode_list(items);
}

bytes_t encode_signed(const legacy_transaction_t& tx,
                      const uint64_t v,
                      const hash32_t& r,
                      const hash32_t& s) {
  auto items = encode_body(tx);
  items.push_back(rlp::encode_integer(v));
  items.push_back(rlp::encode_integer(word_to_integer(r)));
  items.push_back(rlp::encode_integer(word_to_integer(s)));
  return rlp::encode_list(items);
}

hash32_t signing_hash(const legacy_transaction_t& tx) {
  return keyward::keccak::hash(encode_unsigned(tx));
}

signed_transaction_t sign_legacy_transaction(
    const legacy_transaction_t& tx,
    keyward::signer::signing_backend& backend,
    const std::string& key_id) {
  auto digest = signing_hash(tx);
  auto signature = backend.sign_transaction(key_id, digest);
  if (signature.v != 27 && signature.v != 28) {
    throw keyward::common::signer_error{
        signer_error_code_t::signing_failed,
        "backend returned unexpected v " + std::to_string(signature.v)};
  }

  auto recovery_id = static_cast<uint64_t>(signature.v - 27);
  auto out = signed_transaction_t{};
  out.v = *tx.chain_id * 2 + 35 + recovery_id;
  out.r = signature.r;
  out.s = signature.s;
  out.raw = encode_signed(tx, out.v, out.r, out.s);
  out.hash = keyward::keccak::hash(out.raw);
  spdlog::debug("Signed legacy transaction {} on chain {}", to_hex(out.hash),
                *tx.chain_id);
  return out;
}

std::optional<address_t> recover_sender(const legacy_transaction_t& tx,
                                        const signed_transaction_t& signed_tx) {
  require_fields(tx);
  auto base = *tx.chain_id * 2 + 35;
  if (signed_tx.v < base || signed_tx.v > base + 1) {
    return std::nullopt;
  }
  return keyward::crypto::recover_address(
      signing_hash(tx),
      keyward::crypto::compact_signature_t{.r = signed_tx.r, .s = signed_tx.s},
      static_cast<int>(signed_tx.v - base));
}

}  // namespace keyward::evm
