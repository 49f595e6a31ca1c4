#include <insure/schema/encoding/scale/policy_record.hpp>

#include <bit>
#include <cstdint>

namespace insure::schema {

void encode(const policy_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.policy_holder, encoder);
  encode(o.policy_holder_name, encoder);
  encode(std::bit_cast<uint64_t>(o.coverage_amount), encoder);
  encode(std::bit_cast<uint64_t>(o.premium_amount), encoder);
  encode(o.policy_start_date, encoder);
  encode(o.policy_end_date, encoder);
  encode(o.is_claimed, encoder);
  encode(o.created_at, encoder);
  encode(o.updated_at, encoder);
}

void decode(policy_record<1>& o, ::scale::Decoder& decoder) {
  auto coverage_bits = uint64_t{};
  auto premium_bits = uint64_t{};
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.policy_holder, decoder);
  decode(o.policy_holder_name, decoder);
  decode(coverage_bits, decoder);
  decode(premium_bits, decoder);
  decode(o.policy_start_date, decoder);
  decode(o.policy_end_date, decoder);
  decode(o.is_claimed, decoder);
  decode(o.created_at, decoder);
  decode(o.updated_at, decoder);
  o.coverage_amount = std::bit_cast<amount_t>(coverage_bits);
  o.premium_amount = std::bit_cast<amount_t>(premium_bits);
}

}  // namespace insure::schema
