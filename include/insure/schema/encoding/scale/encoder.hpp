#pragma once
#include <insure/common/critical.hpp>
#include <insure/schema/encoding/encoder.hpp>
#include <insure/schema/encoding/scale/policy_record.hpp>
#include <scale/scale.hpp>
#include <utility>

namespace insure::schema::encoding {

struct scale_encoder_tag {};

/// SCALE codec for everything the policy store persists. A record that
/// cannot be written or read back is storage corruption, not a caller error,
/// so encode and decode stop the process; try_decode is for scans that skip
/// bad rows.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  insure::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const insure::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const insure::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
insure::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    insure::common::critical("Failed to SCALE-encode {}", encoded_name_v<T>);
  }
  return std::move(encoded.value());
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const insure::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    insure::common::critical("Failed to SCALE-decode {} from {} stored bytes",
                             encoded_name_v<T>, bytes.size());
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const insure::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace insure::schema::encoding
