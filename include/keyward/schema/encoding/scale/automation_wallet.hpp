#pragma once
#include <keyward/schema/automation_wallet.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared beside the record type so SCALE finds them by argument dependent
// lookup.
namespace keyward::schema {

void encode(const wallet_purpose_t& o, ::scale::Encoder& encoder);
void decode(wallet_purpose_t& o, ::scale::Decoder& decoder);

void encode(const automation_wallet<1>& o, ::scale::Encoder& encoder);
void decode(automation_wallet<1>& o, ::scale::Decoder& decoder);

}  // namespace keyward::schema
