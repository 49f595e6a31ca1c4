#pragma once
#include <spdlog/spdlog.h>
#include <insure/schema/encoding/scale/encoder.hpp>
#include <insure/schema/policy_record.hpp>
#include <insure/storage/storage.hpp>
#include <optional>
#include <utility>
#include <string_view>
#include <vector>

namespace insure::storage {

inline constexpr auto kPolicyKeyPrefix = std::string_view{"POLICY|"};

inline insure::schema::bytes_t make_policy_key(const std::string_view& id) {
  return insure::schema::make_key(kPolicyKeyPrefix, id);
}

/// Policy records keyed by policy id. There is no secondary index; anything
/// that filters (ownership, claim state) scans list_all().
///
/// A row that does not decode is handled differently by the two read paths.
/// get() and remove() address it by id and stop the process through
/// insure::common::critical. list_all() logs a warning and leaves the row out,
/// so one bad row does not hide every other policy.
template <typename Library>
class policy_store final {
 public:
  policy_store(insure::schema::encoding::scale_encoder_t& encoder,
               storage<Library>& storage)
      : encoder_{encoder}, storage_{storage} {}

  /// Insert or overwrite the record stored under id.
  void insert(const std::string_view& id,
              const insure::schema::policy_record_t& record) {
    auto key = make_policy_key(id);
    storage_.put(encoder_, insure::schema::make_bytes_view(key), record);
  }

  std::optional<insure::schema::policy_record_t> get(
      const std::string_view& id) const {
    auto key = make_policy_key(id);
    return storage_.template get<insure::schema::policy_record_t>(
        encoder_, insure::schema::make_bytes_view(key));
  }

  /// Remove id and hand back what was stored there, if anything.
  std::optional<insure::schema::policy_record_t> remove(
      const std::string_view& id) {
    auto key = make_policy_key(id);
    auto previous = storage_.template get<insure::schema::policy_record_t>(
        encoder_, insure::schema::make_bytes_view(key));
    if (previous) {
      storage_.erase(insure::schema::make_bytes_view(key));
    }
    return previous;
  }

  std::vector<insure::schema::policy_record_t> list_all() const {
    auto prefix = insure::schema::make_bytes(kPolicyKeyPrefix);
    auto rows = storage_.list_by_prefix(insure::schema::make_bytes_view(prefix));

    auto records = std::vector<insure::schema::policy_record_t>{};
    records.reserve(rows.size());
    for (const auto& [key, value] : rows) {
      auto decoded = encoder_.try_decode<insure::schema::policy_record_t>(
          insure::schema::make_bytes_view(value));
      if (!decoded.has_value()) {
        spdlog::warn("Failed decoding policy record for key '{}'",
                     insure::schema::make_string_view(key));
        continue;
      }
      records.push_back(std::move(decoded.value()));
    }
    return records;
  }

 private:
  insure::schema::encoding::scale_encoder_t& encoder_;
  storage<Library>& storage_;
};

}  // namespace insure::storage
