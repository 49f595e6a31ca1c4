#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace insure::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;

/// Opaque, already-verified caller identity supplied by the host.
using principal_t = std::string;
using policy_id_t = std::string;
using timestamp_nanoseconds_t = uint64_t;
using amount_t = double;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Concatenate a key prefix and a suffix into one storage key.
bytes_t make_key(const std::string_view& prefix, const std::string_view& suffix);

}  // namespace insure::schema
