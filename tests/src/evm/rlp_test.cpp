#include <gtest/gtest.h>
#include <keyward/evm/rlp.hpp>

#include <string>

namespace {

namespace rlp = keyward::evm::rlp;

std::string hex(const keyward::schema::bytes_t& bytes) {
  return keyward::schema::to_hex(bytes);
}

keyward::schema::bytes_t text(const std::string_view value) {
  return keyward::schema::make_bytes(value);
}

}  // namespace

TEST(rlp, encodes_strings) {
  EXPECT_EQ(hex(rlp::encode_string(text("dog"))), "83646f67");
  EXPECT_EQ(hex(rlp::encode_string({})), "80");
  EXPECT_EQ(hex(rlp::encode_string(keyward::schema::bytes_t{0x0f})), "0f");
  EXPECT_EQ(hex(rlp::encode_string(keyward::schema::bytes_t{0x80})), "8180");

  auto lorem = text("Lorem ipsum dolor sit amet, consectetur adipisicing elit");
  auto encoded = rlp::encode_string(lorem);
  ASSERT_EQ(encoded.size(), lorem.size() + 2);
  EXPECT_EQ(encoded[0], 0xb8);
  EXPECT_EQ(encoded[1], 0x38);
}

TEST(rlp, encodes_integers_minimally) {
  EXPECT_EQ(hex(rlp::encode_integer(0)), "80");
  EXPECT_EQ(hex(rlp::encode_integer(15)), "0f");
  EXPECT_EQ(hex(rlp::encode_integer(127)), "7f");
  EXPECT_EQ(hex(rlp::encode_integer(128)), "8180");
  EXPECT_EQ(hex(rlp::encode_integer(1024)), "820400");
  EXPECT_EQ(hex(rlp::encode_integer(keyward::schema::amount_t{
                "1000000000000000000"})),
            "880de0b6b3a7640000");
}

TEST(rlp, encodes_lists) {
  EXPECT_EQ(hex(rlp::encode_list({})), "c0");
  EXPECT_EQ(hex(rlp::encode_list({rlp::encode_string(text("cat")),
                                  rlp::encode_string(text("dog"))})),
            "c88363617483646f67");
  // [ [], [[]], [ [], [[]] ] ]
  auto empty = rlp::encode_list({});
  auto nested = rlp::encode_list({empty});
  EXPECT_EQ(hex(rlp::encode_list(
                {empty, nested, rlp::encode_list({empty, nested})})),
            "c7c0c1c0c3c0c1c0");
}

TEST(rlp, decodes_nested_items) {
  auto decoded = rlp::decode(keyward::schema::from_hex("c88363617483646f67"));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded->is_list);
  ASSERT_EQ(decoded->items.size(), 2u);
  EXPECT_EQ(decoded->items[0].value, text("cat"));
  EXPECT_EQ(decoded->items[1].value, text("dog"));

  auto single = rlp::decode(keyward::schema::from_hex("7f"));
  ASSERT_TRUE(single.has_value());
  EXPECT_FALSE(single->is_list);
  EXPECT_EQ(single->value, keyward::schema::bytes_t{0x7f});
}

TEST(rlp, decodes_long_strings) {
  auto lorem = text("Lorem ipsum dolor sit amet, consectetur adipisicing elit");
  auto decoded = rlp::decode(rlp::encode_string(lorem));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->value, lorem);
}

TEST(rlp, rejects_non_canonical_input) {
  // Single byte below 0x80 wrapped in a prefix.
  EXPECT_FALSE(rlp::decode(keyward::schema::from_hex("8100")).has_value());
  // Long form for a short payload.
  EXPECT_FALSE(rlp::decode(keyward::schema::from_hex("b80100")).has_value());
  // Length with a leading zero byte.
  EXPECT_FALSE(rlp::decode(keyward::schema::from_hex("b90038")).has_value());
  // Truncated payload.
  EXPECT_FALSE(rlp::decode(keyward::schema::from_hex("83646f")).has_value());
  // Trailing bytes.
  EXPECT_FALSE(rlp::decode(keyward::schema::from_hex("83646f6700")).has_value());
  EXPECT_FALSE(rlp::decode({}).has_value());
}
