#pragma once
#include <insure/schema/primitives.hpp>
#include <optional>
#include <span>
#include <string_view>

namespace insure::schema::encoding {

/// Name a codec reports when it cannot encode or decode a T.
template <typename T>
struct encoded_name {
  static constexpr auto value = std::string_view{"value"};
};

template <typename T>
inline constexpr auto encoded_name_v = encoded_name<T>::value;

// The codec is picked at build time through the tag; storage and the registry
// only ever name encoder<Library>.
template <typename Library>
struct encoder {
  template <typename T>
  insure::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const insure::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const insure::schema::bytes_view_t& bytes);
};

}  // namespace insure::schema::encoding
