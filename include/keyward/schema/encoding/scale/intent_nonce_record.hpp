#pragma once
#include <keyward/schema/intent_nonce_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared beside the record type so SCALE finds them by argument dependent
// lookup.
namespace keyward::schema {

void encode(const intent_nonce_record<1>& o, ::scale::Encoder& encoder);
void decode(intent_nonce_record<1>& o, ::scale::Decoder& decoder);

}  // namespace keyward::schema
