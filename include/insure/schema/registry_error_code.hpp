#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: registry error code.
// Registry workflow: failure taxonomy for policy operations. Zero is reserved
// for success in result envelopes.
namespace insure::schema {

enum class registry_error_code : uint32_t {
  validation = 1,
  not_found = 2,
  conflict = 3,
};

inline constexpr auto kRegistryErrorCodeMappings =
    std::array{std::pair<std::string_view, registry_error_code>{
                   "validation", registry_error_code::validation},
               std::pair<std::string_view, registry_error_code>{
                   "not_found", registry_error_code::not_found},
               std::pair<std::string_view, registry_error_code>{
                   "conflict", registry_error_code::conflict}};

constexpr std::optional<registry_error_code> try_from_string(
    const std::string_view value) {
  for (const auto& [name, code] : kRegistryErrorCodeMappings) {
    if (name == value) {
      return code;
    }
  }
  return std::nullopt;
}

constexpr std::string_view to_string(const registry_error_code value) {
  for (const auto& [name, code] : kRegistryErrorCodeMappings) {
    if (code == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace insure::schema
