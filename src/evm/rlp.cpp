#include <keyward/evm/rlp.hpp>

#include <algorithm>
#include <iterator>

namespace keyward::evm::rlp {

using namespace keyward::schema;

namespace {

constexpr uint8_t kStringOffset = 0x80;
constexpr uint8_t kListOffset = 0xc0;
constexpr std::size_t kShortLimit = 55;

bytes_t encode_length(const std::size_t length, const uint8_t offset) {
  if (length <= kShortLimit) {
    return {static_cast<uint8_t>(offset + length)};
  }
  auto length_bytes = to_big_endian(amount_t{length});
  auto out = bytes_t{
      static_cast<uint8_t>(offset + kShortLimit + length_bytes.size())};
  std::ranges::copy(length_bytes, std::back_inserter(out));
  return out;
}

struct header_t final {
  bool is_list{false};
  std::size_t offset{0};
  std::size_t length{0};
};

std::optional<header_t> read_header(const bytes_view_t& bytes) {
  if (bytes.empty()) {
    return std::nullopt;
  }
  auto prefix = bytes[0];
  if (prefix < kStringOffset) {
    return header_t{.is_list = false, .offset = 0, .length = 1};
  }
  auto is_list = prefix >= kListOffset;
  auto base = is_list ? kListOffset : kStringOffset;
  auto short_length = static_cast<std::size_t>(prefix - base);
  if (short_length <= kShortLimit) {
    if (bytes.size() < 1 + short_length) {
      return std::nullopt;
    }
    if (!is_list && short_length == 1 && bytes[1] < kStringOffset) {
      return std::nullopt;
    }
    return header_t{.is_list = is_list, .offset = 1, .length = short_length};
  }
  auto length_of_length = short_length - kShortLimit;
  if (length_of_length > sizeof(std::size_t) ||
      bytes.size() < 1 + length_of_length || bytes[1] == 0) {
    return std::nullopt;
  }
  auto length = std::size_t{0};
  for (std::size_t i = 0; i < length_of_length; ++i) {
    length = (length << 8) | bytes[1 + i];
  }
  if (length <= kShortLimit ||
      bytes.size() - 1 - length_of_length < length) {
    return std::nullopt;
  }
  return header_t{
      .is_list = is_list, .offset = 1 + length_of_length, .length = length};
}

std::optional<item_t> decode_prefix(const bytes_view_t& bytes,
                                    std::size_t& consumed) {
  auto header = read_header(bytes);
  if (!header) {
    return std::nullopt;
  }
  auto body = bytes.subspan(header->offset, header->length);
  consumed = header->offset + header->length;

  auto item = item_t{.is_list = header->is_list};
  if (!header->is_list) {
    item.value.assign(body.begin(), body.end());
    return item;
  }
  while (!body.empty()) {
    auto used = std::size_t{0};
    auto child = decode_prefix(body, used);
    if (!child) {
      return std::nullopt;
    }
    item.items.push_back(std::move(*child));
    body = body.subspan(used);
  }
  return item;
}

}  // namespace

bytes_t encode_string(const bytes_view_t& bytes) {
  if (bytes.size() == 1 && bytes[0] < kStringOffset) {
    return {bytes[0]};
  }
  auto out = encode_length(bytes.size(), kStringOffset);
  std::ranges::copy(bytes, std::back_inserter(out));
  return out;
}

bytes_t encode_integer(const amount_t& value) {
  return encode_string(to_big_endian(value));
}

bytes_t encode_list(const std::vector<bytes_t>& encoded_items) {
  auto length = std::size_t{0};
  for (const auto& item : encoded_items) {
    length += item.size();
  }
  auto out = encode_length(length, kListOffset);
  out.reserve(out.size() + length);
  for (const auto& item : encoded_items) {
    std::ranges::copy(item, std::back_inserter(out));
  }
  return out;
}

std::optional<item_t> decode(const bytes_view_t& bytes) {
  auto consumed = std::size_t{0};
  auto item = decode_prefix(bytes, consumed);
  if (!item || consumed != bytes.size()) {
    return std::nullopt;
  }
  return item;
}

}  // namespace keyward::evm::rlp
