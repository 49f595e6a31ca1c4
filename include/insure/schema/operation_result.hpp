#pragma once

#include <insure/schema/policy_record.hpp>
#include <insure/schema/registry_error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: operation result.
// Registry workflow: envelope returned by every registry operation. `code` is
// zero on success and a registry_error_code otherwise; `log` carries the
// human-readable reason and `value` is set only on success.
namespace insure::schema {

template <typename T>
struct operation_result final {
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == 0; }

  std::optional<registry_error_code> error() const {
    if (code == 0) {
      return std::nullopt;
    }
    return static_cast<registry_error_code>(code);
  }
};

using policy_result_t = operation_result<policy_record_t>;
using policy_list_result_t = operation_result<std::vector<policy_record_t>>;

}  // namespace insure::schema
