#include <keyward/schema/encoding/scale/automation_wallet.hpp>
#include <keyward/schema/encoding/scale/signing_key.hpp>

namespace keyward::schema {

void encode(const wallet_purpose_t& o, ::scale::Encoder& encoder) {
  std::visit(overloaded{[&](const automation_purpose&) {
                          encode(uint8_t{0}, encoder);
                        },
                        [&](const strategy_purpose& value) {
                          encode(uint8_t{1}, encoder);
                          encode(value.strategy_id, encoder);
                        }},
             o);
}

void decode(wallet_purpose_t& o, ::scale::Decoder& decoder) {
  auto tag = uint8_t{};
  decode(tag, decoder);
  if (tag == 0) {
    o = automation_purpose{};
    return;
  }
  auto value = strategy_purpose{};
  decode(value.strategy_id, decoder);
  o = std::move(value);
}

void encode(const automation_wallet<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.wallet_id, encoder);
  encode(o.owner, encoder);
  encode(o.purpose, encoder);
  encode(o.label, encoder);
  encode(o.signing_key, encoder);
  encode(o.is_active, encoder);
  encode(o.created_at, encoder);
  encode(o.last_used_at, encoder);
}

void decode(automation_wallet<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.wallet_id, decoder);
  decode(o.owner, decoder);
  decode(o.purpose, decoder);
  decode(o.label, decoder);
  decode(o.signing_key, decoder);
  decode(o.is_active, decoder);
  decode(o.created_at, decoder);
  decode(o.last_used_at, decoder);
}

}  // namespace keyward::schema
