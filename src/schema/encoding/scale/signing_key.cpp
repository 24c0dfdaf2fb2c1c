#include <keyward/schema/encoding/scale/signing_key.hpp>

namespace keyward::schema {

void encode(const signing_key<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.key_id, encoder);
  encode(o.wallet_address, encoder);
  encode(static_cast<uint8_t>(o.provider), encoder);
  encode(static_cast<uint8_t>(o.family), encoder);
  encode(o.encrypted_material, encoder);
  encode(o.created_at, encoder);
}

void decode(signing_key<1>& o, ::scale::Decoder& decoder) {
  auto provider = uint8_t{};
  auto family = uint8_t{};
  decode(o.version, decoder);
  decode(o.key_id, decoder);
  decode(o.wallet_address, decoder);
  decode(provider, decoder);
  decode(family, decoder);
  decode(o.encrypted_material, decoder);
  decode(o.created_at, decoder);
  o.provider = static_cast<key_provider_t>(provider);
  o.family = static_cast<chain_family_t>(family);
}

}  // namespace keyward::schema
