#include <gtest/gtest.h>

#include "relay/path_identity.hpp"

TEST(PathIdentityTest, ReadsLastTwoSegments) {
  auto identity = relay::ParsePeerIdentity("/game1/host");
  EXPECT_EQ(identity.channel_id, "game1");
  EXPECT_EQ(identity.player_id, "host");
}

TEST(PathIdentityTest, LowerCasesAndDropsQuery) {
  auto identity = relay::ParsePeerIdentity("/Game1/PlayerOne?v=2");
  EXPECT_EQ(identity.channel_id, "game1");
  EXPECT_EQ(identity.player_id, "playerone");
}

TEST(PathIdentityTest, IgnoresLeadingSegments) {
  auto identity = relay::ParsePeerIdentity("/relay/v1/room/p7");
  EXPECT_EQ(identity.channel_id, "room");
  EXPECT_EQ(identity.player_id, "p7");
}

TEST(PathIdentityTest, ShortPathsYieldEmptyIds) {
  auto single = relay::ParsePeerIdentity("/host");
  EXPECT_EQ(single.channel_id, "");
  EXPECT_EQ(single.player_id, "host");

  auto root = relay::ParsePeerIdentity("/");
  EXPECT_EQ(root.channel_id, "");
  EXPECT_EQ(root.player_id, "");

  auto trailing = relay::ParsePeerIdentity("/game1/");
  EXPECT_EQ(trailing.channel_id, "game1");
  EXPECT_EQ(trailing.player_id, "");
}
