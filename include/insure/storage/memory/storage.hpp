#pragma once
#include <insure/storage/storage.hpp>
#include <map>
#include <string>
#include <string_view>

namespace insure::storage {

/// Process-local backend: an ordered map owned by the storage instance. Two
/// instances never share state, which keeps tests isolated.
struct memory_storage_tag {};

template <>
struct storage<memory_storage_tag> final {
  std::map<std::string, insure::schema::bytes_t, std::less<>> entries;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const insure::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const insure::schema::bytes_view_t& key,
           const T& value);

  void erase(const insure::schema::bytes_view_t& key);
  std::vector<key_value_entry_t> list_by_prefix(
      const insure::schema::bytes_view_t& prefix) const;
};

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>();

template <typename T, typename Encoder>
std::optional<T> storage<memory_storage_tag>::get(
    Encoder& encoder,
    const insure::schema::bytes_view_t& key) const {
  auto found = entries.find(insure::schema::make_string_view(key));
  if (found == std::end(entries)) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      insure::schema::make_bytes_view(found->second))};
}

template <typename T, typename Encoder>
void storage<memory_storage_tag>::put(Encoder& encoder,
                                      const insure::schema::bytes_view_t& key,
                                      const T& value) {
  entries.insert_or_assign(insure::schema::make_string(key),
                           encoder.encode(value));
}

}  // namespace insure::storage
