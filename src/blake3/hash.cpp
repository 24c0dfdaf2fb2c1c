#include <blake3.h>
#include <keyward/blake3/hash.hpp>

namespace keyward::blake3 {

keyward::schema::hash32_t hash(const std::string_view& str) {
  return hash(std::span<const uint8_t>{
      reinterpret_cast<const uint8_t*>(str.data()), str.size()});
}

keyward::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = keyward::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<keyward::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace keyward::blake3
