#pragma once
#include <keyward/schema/signing_key.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared beside the record type so SCALE finds them by argument dependent
// lookup.
namespace keyward::schema {

void encode(const signing_key<1>& o, ::scale::Encoder& encoder);
void decode(signing_key<1>& o, ::scale::Decoder& decoder);

}  // namespace keyward::schema
