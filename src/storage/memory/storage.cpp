#include <insure/storage/memory/storage.hpp>
#include <spdlog/spdlog.h>

namespace insure::storage {

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>() {
  spdlog::debug("Created in-memory policy storage");
  return storage<memory_storage_tag>{};
}

void storage<memory_storage_tag>::erase(
    const insure::schema::bytes_view_t& key) {
  auto found = entries.find(insure::schema::make_string_view(key));
  if (found != std::end(entries)) {
    entries.erase(found);
  }
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const insure::schema::bytes_view_t& prefix) const {
  auto prefix_view = insure::schema::make_string_view(prefix);
  auto rows = std::vector<key_value_entry_t>{};
  for (auto it = entries.lower_bound(prefix_view); it != std::end(entries);
       ++it) {
    if (!std::string_view{it->first}.starts_with(prefix_view)) {
      break;
    }
    rows.push_back(
        key_value_entry_t{insure::schema::make_bytes(it->first), it->second});
  }
  return rows;
}

}  // namespace insure::storage
