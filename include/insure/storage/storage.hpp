#pragma once
#include <insure/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace insure::storage {

using key_value_entry_t =
    std::pair<insure::schema::bytes_t, insure::schema::bytes_t>;

/// Ordered key-value backend selected by a library tag.
template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const insure::schema::bytes_view_t& key) const;

  /// Encode and persist value at key, overwriting any previous value.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const insure::schema::bytes_view_t& key,
           const T& value);

  /// Remove key. Missing keys are not an error.
  void erase(const insure::schema::bytes_view_t& key);

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const insure::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// Construct a backend that needs no location (in-process backends).
template <typename Library>
storage<Library> make_storage();

}  // namespace insure::storage
