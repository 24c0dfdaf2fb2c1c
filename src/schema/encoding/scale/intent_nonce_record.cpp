#include <keyward/schema/encoding/scale/intent_nonce_record.hpp>

namespace keyward::schema {

void encode(const intent_nonce_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.signer, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.intent_type, encoder);
  encode(o.used_at, encoder);
}

void decode(intent_nonce_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.signer, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.intent_type, decoder);
  decode(o.used_at, decoder);
}

}  // namespace keyward::schema
