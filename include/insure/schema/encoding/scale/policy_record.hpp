#pragma once

#include <insure/schema/encoding/encoder.hpp>
#include <insure/schema/policy_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared beside the schema type so the codec finds them by ADL. Amounts are
// written as their IEEE-754 bit pattern since SCALE has no floating-point
// type.
namespace insure::schema {

void encode(const policy_record<1>& o, ::scale::Encoder& encoder);
void decode(policy_record<1>& o, ::scale::Decoder& decoder);

}  // namespace insure::schema

namespace insure::schema::encoding {

template <>
struct encoded_name<insure::schema::policy_record<1>> {
  static constexpr auto value = std::string_view{"policy record"};
};

}  // namespace insure::schema::encoding
