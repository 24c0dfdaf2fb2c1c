#include <keyward/crypto/secp256k1.hpp>
#include <keyward/intent/intent_verifier.hpp>
#include <keyward/schema/intent_nonce_record.hpp>
#include <keyward/schema/key/intent_nonce_record.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace keyward::intent {

using namespace keyward::schema;

namespace {

template <typename Intent>
verification_result<Intent> reject(const intent_error_code_t code,
                                   std::string error) {
  spdlog::warn("Intent rejected with {}: {}", to_string(code), error);
  auto result = verification_result<Intent>{};
  result.error = std::move(error);
  result.error_code = code;
  return result;
}

/// 65 bytes hex, v in {0, 1, 27, 28}.
std::optional<bytes_t> parse_signature(const std::string& signature) {
  if (!signature.starts_with("0x")) {
    return std::nullopt;
  }
  auto bytes = try_from_hex(signature);
  if (!bytes || bytes->size() != 65) {
    return std::nullopt;
  }
  auto v = (*bytes)[64];
  if (v != 0 && v != 1 && v != 27 && v != 28) {
    return std::nullopt;
  }
  return bytes;
}

}  // namespace

intent_verifier::intent_verifier(storage_t& storage,
                                 keyward::common::clock_fn_t clock)
    : storage_(storage), clock_(std::move(clock)) {}

generic_verification_result_t intent_verifier::verify(
    const signed_generic_intent_t& signed_intent,
    const verify_options_t& options) {
  return verify(signed_intent, options, clock_());
}

generic_verification_result_t intent_verifier::verify(
    const signed_generic_intent_t& signed_intent,
    const verify_options_t& options,
    const timestamp_milliseconds_t now) {
  auto schema_error = std::string{};
  auto intent = parse_generic_intent(signed_intent.intent, schema_error);
  if (!intent) {
    return reject<generic_intent_t>(intent_error_code_t::invalid_schema,
                                    "Invalid intent schema: " + schema_error);
  }

  if (intent->expires_at) {
    auto expires_at = parse_iso8601(*intent->expires_at);
    if (expires_at && *expires_at < now) {
      return reject<generic_intent_t>(intent_error_code_t::intent_expired,
                                      "Intent has expired");
    }
  }

  auto digest = std::optional<hash32_t>{};
  try {
    digest = hash_generic_intent(*intent);
  } catch (const eip712::typed_data_error& e) {
    return reject<generic_intent_t>(intent_error_code_t::invalid_schema,
                                    std::string{"Invalid intent schema: "} +
                                        e.what());
  }
  if (!digest) {
    return reject<generic_intent_t>(
        intent_error_code_t::unknown_intent_type,
        "Unknown intent type " + intent->intent_type);
  }

  auto signature = parse_signature(signed_intent.signature);
  auto recovered = signature
                       ? keyward::crypto::recover_address(*digest, *signature)
                       : std::nullopt;
  if (!recovered) {
    return reject<generic_intent_t>(
        intent_error_code_t::invalid_signature,
        "Could not recover signer from signature");
  }

  if (*recovered != intent->signer) {
    return reject<generic_intent_t>(
        intent_error_code_t::signer_mismatch,
        "Signer mismatch: expected " + to_address_string(intent->signer) +
            ", got " + to_address_string(*recovered));
  }

  if (!options.skip_nonce_check &&
      is_nonce_used(intent->signer, intent->chain_id, intent->nonce)) {
    return reject<generic_intent_t>(intent_error_code_t::nonce_used,
                                    "Nonce has already been used");
  }

  spdlog::info("Verified {} intent {}", intent->intent_type, intent->nonce);
  auto result = generic_verification_result_t{};
  result.valid = true;
  result.recovered_address = *recovered;
  result.intent = std::move(intent);
  return result;
}

bool intent_verifier::record_nonce_used(const generic_intent_t& intent) {
  return record_nonce_used(intent, clock_());
}

bool intent_verifier::record_nonce_used(const generic_intent_t& intent,
                                        const timestamp_milliseconds_t now) {
  auto encoder = encoder_t{};
  auto record = intent_nonce_record_t{};
  record.signer = to_address_string(intent.signer);
  record.chain_id = intent.chain_id;
  record.nonce = intent.nonce;
  record.intent_type = intent.intent_type;
  record.used_at = now;

  auto key = key::make_intent_nonce_key(intent.signer, intent.chain_id,
                                        intent.nonce);
  auto recorded = storage_.put_if_absent_batch(key, encoder.encode(record), {});
  if (!recorded) {
    spdlog::warn("Intent nonce {} for {} was already recorded", intent.nonce,
                 record.signer);
  }
  return recorded;
}

bool intent_verifier::is_nonce_used(const address_t& signer,
                                    const chain_id_t chain_id,
                                    const std::string& nonce) {
  auto encoder = encoder_t{};
  return storage_
      .get<encoder_t, intent_nonce_record_t>(
          encoder, key::make_intent_nonce_key(signer, chain_id, nonce))
      .has_value();
}

permission_verification_result_t intent_verifier::verify_permission(
    const signed_permission_intent_t& signed_intent) const {
  auto digest = hash32_t{};
  try {
    digest = hash_permission_intent(flatten(signed_intent.intent));
  } catch (const eip712::typed_data_error& e) {
    return reject<permission_intent_t>(intent_error_code_t::invalid_schema,
                                       e.what());
  }

  auto signature = parse_signature(signed_intent.signature);
  auto recovered = signature
                       ? keyward::crypto::recover_address(digest, *signature)
                       : std::nullopt;
  if (!recovered) {
    return reject<permission_intent_t>(
        intent_error_code_t::invalid_signature,
        "Could not recover signer from signature");
  }
  if (*recovered != signed_intent.signer) {
    return reject<permission_intent_t>(
        intent_error_code_t::signer_mismatch,
        "Signer mismatch: expected " +
            to_address_string(signed_intent.signer) + ", got " +
            to_address_string(*recovered));
  }

  spdlog::debug("Verified permission intent {}", signed_intent.intent.id);
  auto result = permission_verification_result_t{};
  result.valid = true;
  result.intent = signed_intent.intent;
  result.recovered_address = *recovered;
  return result;
}

}  // namespace keyward::intent
