#include <gtest/gtest.h>

#include <regex>

#include "relay/origin_policy.hpp"

TEST(OriginPolicyTest, DefaultPatternAcceptsKnownOrigins) {
  relay::OriginPolicy policy(relay::kDefaultOriginPattern);
  EXPECT_TRUE(policy.Allows("https://bra1n.github.io"));
  EXPECT_TRUE(policy.Allows("http://localhost:8080"));
  EXPECT_TRUE(policy.Allows("https://clocktower.online"));
  EXPECT_TRUE(policy.Allows("HTTPS://CLOCKTOWER.ONLINE"));
  EXPECT_TRUE(policy.Allows("https://eddbra1nprivatetownsquare.xyz"));
}

TEST(OriginPolicyTest, DefaultPatternRejectsOthers) {
  relay::OriginPolicy policy(relay::kDefaultOriginPattern);
  EXPECT_FALSE(policy.Allows(""));
  EXPECT_FALSE(policy.Allows("https://evil.example.com"));
  EXPECT_FALSE(policy.Allows("https://a.b.github.io"));
  EXPECT_FALSE(policy.Allows("ftp://localhost"));
}

TEST(OriginPolicyTest, CustomPattern) {
  relay::OriginPolicy policy("^https://game\\.test$");
  EXPECT_TRUE(policy.Allows("https://game.test"));
  EXPECT_FALSE(policy.Allows("https://game.test.evil"));
}

TEST(OriginPolicyTest, InvalidPatternThrows) {
  EXPECT_THROW(relay::OriginPolicy("(unclosed"), std::regex_error);
}
