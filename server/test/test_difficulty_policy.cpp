#include "DifficultyPolicy.h"
#include <gtest/gtest.h>

using namespace hv;

TEST(DifficultyPolicyTest, DefaultsMatchLowStakesPrefixes) {
  DifficultyPolicy policy;
  EXPECT_EQ(policy.bitsFor("election_2024"), 18);
  EXPECT_EQ(policy.bitsFor("test_poll"), 4);
  EXPECT_EQ(policy.bitsFor("audit_run"), 4);
  EXPECT_EQ(policy.bitsFor("testing"), 18);
  EXPECT_EQ(policy.bitsFor(""), 18);
  EXPECT_TRUE(policy.isLowStakes("audit_"));
  EXPECT_FALSE(policy.isLowStakes("p_test_"));
}

TEST(DifficultyPolicyTest, CustomConfig) {
  DifficultyPolicy::Config config;
  config.defaultBits = 20;
  config.reducedBits = 1;
  config.lowStakesPrefixes = { "demo-", "" };
  DifficultyPolicy policy(config);

  EXPECT_EQ(policy.bitsFor("demo-1"), 1);
  // An empty prefix never matches
  EXPECT_EQ(policy.bitsFor("test_poll"), 20);
  EXPECT_EQ(policy.getConfig().defaultBits, 20);
}
