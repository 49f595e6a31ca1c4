#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <insure/common/critical.hpp>
#include <insure/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace insure::storage {

namespace detail {

inline insure::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const insure::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

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
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const insure::schema::bytes_view_t& key) const {
  if (!database) {
    insure::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    insure::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(insure::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const insure::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    insure::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(insure::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    insure::common::critical("Failed to put value into RocksDB");
  }
}

inline void storage<rocksdb_storage_tag>::erase(
    const insure::schema::bytes_view_t& key) {
  if (!database) {
    insure::common::critical("RocksDB database is not initialized");
  }
  auto status =
      database->Delete(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete value from RocksDB: {}",
                  status.ToString());
    insure::common::critical("Failed to delete value from RocksDB");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const insure::schema::bytes_view_t& prefix) const {
  if (!database) {
    insure::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = insure::schema::make_string_view(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(detail::to_slice(prefix));
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    insure::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace insure::storage
