#include <gtest/gtest.h>
#include <keyward/keccak/hash.hpp>

#include <string>

TEST(keccak, empty_input_vector) {
  EXPECT_EQ(keyward::keccak::hash(std::string_view{}),
            keyward::schema::make_hash32(
                "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470"));
}

TEST(keccak, abc_vector) {
  EXPECT_EQ(keyward::keccak::hash(std::string_view{"abc"}),
            keyward::schema::make_hash32(
                "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45"));
}

TEST(keccak, incremental_updates_match_one_shot_across_blocks) {
  auto input = std::string(300, 'k');
  auto hasher = keyward::keccak::hasher{};
  hasher.update(std::string_view{input}.substr(0, 7))
      .update(std::string_view{input}.substr(7, 136))
      .update(std::string_view{input}.substr(143));
  EXPECT_EQ(hasher.finalize(), keyward::keccak::hash(input));
}

TEST(keccak, exact_rate_input_differs_from_shorter_prefix) {
  auto block = std::string(136, 'x');
  EXPECT_NE(keyward::keccak::hash(block),
            keyward::keccak::hash(std::string_view{block}.substr(0, 135)));
}
