#include <keyward/keccak/hash.hpp>

#include <algorithm>

namespace keyward::keccak {

namespace {

constexpr auto kRoundConstants = std::array<uint64_t, 24>{
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

constexpr auto kPiLane = std::array<int, 24>{10, 7,  11, 17, 18, 3,  5,  16,
                                             8,  21, 24, 4,  15, 23, 19, 13,
                                             12, 2,  20, 14, 22, 9,  6,  1};

constexpr auto kRotation = std::array<int, 24>{1,  3,  6,  10, 15, 21, 28, 36,
                                               45, 55, 2,  14, 27, 41, 56, 8,
                                               25, 43, 62, 18, 39, 61, 20, 44};

constexpr uint64_t rotl64(const uint64_t x, const int n) {
  return (x << n) | (x >> (64 - n));
}

void keccak_f1600(std::array<uint64_t, 25>& st) {
  for (const auto round_constant : kRoundConstants) {
    auto bc = std::array<uint64_t, 5>{};

    // theta
    for (auto i = 0; i < 5; ++i) {
      bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
    }
    for (auto i = 0; i < 5; ++i) {
      auto t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
      for (auto j = 0; j < 25; j += 5) {
        st[j + i] ^= t;
      }
    }

    // rho and pi
    auto t = st[1];
    for (auto i = 0; i < 24; ++i) {
      auto j = kPiLane[i];
      auto next = st[j];
      st[j] = rotl64(t, kRotation[i]);
      t = next;
    }

    // chi
    for (auto j = 0; j < 25; j += 5) {
      for (auto i = 0; i < 5; ++i) {
        bc[i] = st[j + i];
      }
      for (auto i = 0; i < 5; ++i) {
        st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
      }
    }

    // iota
    st[0] ^= round_constant;
  }
}

}  // namespace

hasher::hasher() = default;

void hasher::absorb_block(const uint8_t* block) {
  for (std::size_t i = 0; i < kRate / 8; ++i) {
    auto lane = uint64_t{0};
    for (std::size_t b = 0; b < 8; ++b) {
      lane |= static_cast<uint64_t>(block[(i * 8) + b]) << (8 * b);
    }
    state_[i] ^= lane;
  }
  keccak_f1600(state_);
}

hasher& hasher::update(const std::span<const uint8_t>& bytes) {
  auto remaining = bytes;
  while (!remaining.empty()) {
    auto take = std::min(kRate - buffered_, remaining.size());
    std::copy_n(remaining.begin(), take, buffer_.begin() + buffered_);
    buffered_ += take;
    remaining = remaining.subspan(take);
    if (buffered_ == kRate) {
      absorb_block(buffer_.data());
      buffered_ = 0;
    }
  }
  return *this;
}

hasher& hasher::update(const std::string_view& str) {
  return update(std::span<const uint8_t>{
      reinterpret_cast<const uint8_t*>(str.data()), str.size()});
}

keyward::schema::hash32_t hasher::finalize() {
  std::fill(buffer_.begin() + buffered_, buffer_.end(), uint8_t{0});
  buffer_[buffered_] |= 0x01;
  buffer_[kRate - 1] |= 0x80;
  absorb_block(buffer_.data());

  auto out = keyward::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(state_[i / 8] >> (8 * (i % 8)));
  }

  state_.fill(0);
  buffer_.fill(0);
  buffered_ = 0;
  return out;
}

keyward::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

keyward::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace keyward::keccak
