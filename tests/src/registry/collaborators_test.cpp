#include <insure/registry/collaborators.hpp>
#include <gtest/gtest.h>

#include <set>
#include <string>

TEST(collaborators, system_time_source_never_goes_backwards) {
  auto now = insure::registry::make_system_time_source();
  auto previous = now();
  EXPECT_GT(previous, 0u);
  for (int i = 0; i < 1000; ++i) {
    auto current = now();
    EXPECT_GE(current, previous);
    previous = current;
  }
}

TEST(collaborators, uuid_generator_yields_distinct_canonical_ids) {
  auto next_id = insure::registry::make_uuid_generator();
  auto seen = std::set<std::string>{};
  for (int i = 0; i < 256; ++i) {
    auto id = next_id();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_TRUE(seen.insert(id).second);
  }
}

TEST(collaborators, fixed_identity_returns_principal) {
  auto caller = insure::registry::make_fixed_identity("principal-alice");
  EXPECT_EQ(caller(), "principal-alice");
  EXPECT_EQ(caller(), "principal-alice");
}
