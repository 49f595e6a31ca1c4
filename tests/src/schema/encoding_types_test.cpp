#include <insure/schema/encoding/scale/encoder.hpp>
#include <insure/schema/operation_result.hpp>
#include <insure/schema/policy_payload.hpp>
#include <insure/schema/policy_record.hpp>
#include <insure/testing/common.hpp>
#include <gtest/gtest.h>

namespace {

using encoder_t = insure::schema::encoding::scale_encoder_t;

}  // namespace

TEST(encoding_types, policy_record_defaults_are_stable) {
  auto record = insure::schema::policy_record_t{};
  EXPECT_EQ(record.version, 1u);
  EXPECT_TRUE(record.id.empty());
  EXPECT_FALSE(record.is_claimed);
  EXPECT_EQ(record.created_at, 0u);
  EXPECT_FALSE(record.updated_at.has_value());
}

TEST(encoding_types, policy_record_survives_scale_encoding) {
  auto encoder = encoder_t{};
  auto record = insure::testing::make_record("policy-1", "principal-alice");

  auto unmodified = encoder.decode<insure::schema::policy_record_t>(
      insure::schema::make_bytes_view(encoder.encode(record)));
  EXPECT_EQ(unmodified, record);
  EXPECT_FALSE(unmodified.updated_at.has_value());
  EXPECT_DOUBLE_EQ(unmodified.coverage_amount, 250000.5);
  EXPECT_DOUBLE_EQ(unmodified.premium_amount, 812.25);

  record.is_claimed = true;
  record.updated_at = 99;
  auto claimed = encoder.decode<insure::schema::policy_record_t>(
      insure::schema::make_bytes_view(encoder.encode(record)));
  EXPECT_EQ(claimed, record);
  ASSERT_TRUE(claimed.updated_at.has_value());
  EXPECT_EQ(*claimed.updated_at, 99u);
}

TEST(encoding_types, truncated_policy_record_is_rejected) {
  auto encoder = encoder_t{};
  auto encoded =
      encoder.encode(insure::testing::make_record("policy-1", "someone"));
  encoded.resize(encoded.size() / 2);
  auto decoded = encoder.try_decode<insure::schema::policy_record_t>(
      insure::schema::make_bytes_view(encoded));
  EXPECT_FALSE(decoded.has_value());
}

TEST(encoding_types_death_test, decoding_a_truncated_policy_record_is_fatal) {
  auto encoder = encoder_t{};
  auto encoded =
      encoder.encode(insure::testing::make_record("policy-1", "someone"));
  encoded.resize(3);

  EXPECT_EQ(insure::schema::encoding::encoded_name_v<
                insure::schema::policy_record_t>,
            "policy record");
  EXPECT_EQ(insure::schema::encoding::encoded_name_v<uint64_t>, "value");
  EXPECT_DEATH(encoder.decode<insure::schema::policy_record_t>(
                   insure::schema::make_bytes_view(encoded)),
               "");
}

TEST(encoding_types, payload_reports_first_missing_field) {
  auto payload = insure::testing::make_payload();
  EXPECT_FALSE(insure::schema::first_missing_field(payload).has_value());

  payload.premium_amount.reset();
  payload.policy_end_date.reset();
  EXPECT_EQ(insure::schema::first_missing_field(payload), "premiumAmount");

  auto empty = insure::schema::policy_payload_t{};
  EXPECT_EQ(insure::schema::first_missing_field(empty), "policyHolderName");
}

TEST(encoding_types, payload_policy_holder_is_not_required) {
  auto payload = insure::testing::make_payload();
  payload.policy_holder.reset();
  EXPECT_FALSE(insure::schema::first_missing_field(payload).has_value());
}

TEST(encoding_types, operation_result_defaults_to_success) {
  auto result = insure::schema::policy_result_t{};
  EXPECT_TRUE(result.ok());
  EXPECT_FALSE(result.error().has_value());
  EXPECT_FALSE(result.value.has_value());

  result.code =
      static_cast<uint32_t>(insure::schema::registry_error_code::not_found);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error(), insure::schema::registry_error_code::not_found);
}
