#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace keyward::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using selector_t = std::array<uint8_t, 4>;
using amount_t = boost::multiprecision::uint256_t;
using chain_id_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_view_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Parse a 0x-prefixed (or bare) 40 character hex address. Case is ignored.
std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_address(const std::string_view& hex);

/// Lowercase 0x-prefixed rendering used for keys and comparisons.
std::string to_address_string(const address_t& address);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const bytes_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(const std::string_view encoded);
bytes_t from_base64(const std::string_view encoded);

/// Big-endian minimal byte representation (zero encodes as empty).
bytes_t to_big_endian(const amount_t& value);
/// Left-padded 32 byte big-endian word.
hash32_t to_word(const amount_t& value);
amount_t from_big_endian(const bytes_view_t& bytes);

}  // namespace keyward::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
