#include <keyward/schema/encoding/scale/nonce_record.hpp>

namespace keyward::schema {

void encode(const nonce_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.wallet_id, encoder);
  encode(o.chain_id, encoder);
  encode(o.next_nonce, encoder);
}

void decode(nonce_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.wallet_id, decoder);
  decode(o.chain_id, decoder);
  decode(o.next_nonce, decoder);
}

}  // namespace keyward::schema
