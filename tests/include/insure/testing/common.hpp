#pragma once

#include <insure/schema/policy_payload.hpp>
#include <insure/schema/policy_record.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace insure::testing {

inline insure::schema::policy_payload_t make_payload(
    const std::string_view holder_name = "Alice") {
  auto payload = insure::schema::policy_payload_t{};
  payload.policy_holder_name = std::string{holder_name};
  payload.coverage_amount = 100000.0;
  payload.premium_amount = 500.0;
  payload.policy_start_date = 1000;
  payload.policy_end_date = 2000;
  payload.is_claimed = false;
  return payload;
}

inline insure::schema::policy_record_t make_record(
    const std::string_view id,
    const std::string_view holder) {
  auto record = insure::schema::policy_record_t{};
  record.id = std::string{id};
  record.policy_holder = std::string{holder};
  record.policy_holder_name = "Alice";
  record.coverage_amount = 250000.5;
  record.premium_amount = 812.25;
  record.policy_start_date = 1000;
  record.policy_end_date = 2000;
  record.created_at = 42;
  return record;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace insure::testing
