#pragma once
#include <keyward/schema/primitives.hpp>
#include <optional>
#include <vector>

// Recursive length prefix encoding as used by Ethereum transactions.
namespace keyward::evm::rlp {

/// Byte string item. A single byte below 0x80 encodes as itself.
keyward::schema::bytes_t encode_string(
    const keyward::schema::bytes_view_t& bytes);

/// Unsigned integer item, minimal big-endian. Zero encodes as 0x80.
keyward::schema::bytes_t encode_integer(const keyward::schema::amount_t& value);

/// List item wrapping already encoded items.
keyward::schema::bytes_t encode_list(
    const std::vector<keyward::schema::bytes_t>& encoded_items);

struct item_t final {
  bool is_list{false};
  keyward::schema::bytes_t value;
  std::vector<item_t> items;
};

/// Decode exactly one item spanning all of bytes. Non-canonical length
/// prefixes are rejected.
std::optional<item_t> decode(const keyward::schema::bytes_view_t& bytes);

}  // namespace keyward::evm::rlp
