#pragma once
#include <keyward/schema/primitives.hpp>
#include <optional>
#include <span>

namespace keyward::schema::encoding {

// The wire library is chosen at build time through the tag type; records
// never name the library directly.
template <typename Library>
struct encoder {
  template <typename T>
  keyward::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, keyward::schema::bytes_t& out);

  template <typename T>
  T decode(const keyward::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const keyward::schema::bytes_view_t& bytes);
};

}  // namespace keyward::schema::encoding
