#include <insure/common/critical.hpp>
#include <insure/storage/rocksdb/storage.hpp>

namespace insure::storage {

// Opens (creating on first use) the directory holding the policy database.
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  if (path.empty()) {
    insure::common::critical("Policy database path is empty");
  }

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  // Policy rows are small and read by point lookups or one prefix scan.
  options.OptimizeForSmallDb();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    insure::common::critical("Failed to open policy database at {}: {}", path,
                             status.ToString());
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  spdlog::info("Opened policy database at {} (last sequence {})", path,
               store.database->GetLatestSequenceNumber());
  return store;
}

}  // namespace insure::storage
