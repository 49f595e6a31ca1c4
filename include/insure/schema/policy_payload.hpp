#pragma once

#include <insure/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: policy payload.
// Registry workflow: caller-supplied fields for create/update. Every field is
// optional on the wire so an incomplete payload can be reported by name.
namespace insure::schema {

template <uint16_t Version>
struct policy_payload;

template <>
struct policy_payload<1> final {
  uint16_t version{1};
  // Never trusted; ownership comes from the caller identity.
  std::optional<principal_t> policy_holder;
  std::optional<std::string> policy_holder_name;
  std::optional<amount_t> coverage_amount;
  std::optional<amount_t> premium_amount;
  std::optional<timestamp_nanoseconds_t> policy_start_date;
  std::optional<timestamp_nanoseconds_t> policy_end_date;
  std::optional<bool> is_claimed;
};

using policy_payload_t = policy_payload<1>;

/// Field names reported by validation, in the order they are checked.
inline constexpr auto kPolicyPayloadRequiredFields =
    std::array<std::string_view, 6>{"policyHolderName", "coverageAmount",
                                    "premiumAmount",    "policyStartDate",
                                    "policyEndDate",    "isClaimed"};

/// Name of the first required field the payload leaves out, if any.
inline std::optional<std::string_view> first_missing_field(
    const policy_payload_t& payload) {
  const auto present = std::array<bool, 6>{
      payload.policy_holder_name.has_value(),
      payload.coverage_amount.has_value(),
      payload.premium_amount.has_value(),
      payload.policy_start_date.has_value(),
      payload.policy_end_date.has_value(),
      payload.is_claimed.has_value()};
  for (std::size_t i = 0; i < present.size(); ++i) {
    if (!present[i]) {
      return kPolicyPayloadRequiredFields[i];
    }
  }
  return std::nullopt;
}

}  // namespace insure::schema
