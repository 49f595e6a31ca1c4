#pragma once

#include <insure/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: policy record.
// Registry workflow: the persisted life-insurance policy. `id`,
// `policy_holder` and `created_at` are fixed at creation; `is_claimed` only
// ever moves from false to true.
namespace insure::schema {

template <uint16_t Version>
struct policy_record;

template <>
struct policy_record<1> final {
  uint16_t version{1};
  policy_id_t id;
  principal_t policy_holder;
  std::string policy_holder_name;
  amount_t coverage_amount{};
  amount_t premium_amount{};
  timestamp_nanoseconds_t policy_start_date{};
  timestamp_nanoseconds_t policy_end_date{};
  bool is_claimed{false};
  timestamp_nanoseconds_t created_at{};
  std::optional<timestamp_nanoseconds_t> updated_at;

  bool operator==(const policy_record&) const = default;
};

using policy_record_t = policy_record<1>;

}  // namespace insure::schema
