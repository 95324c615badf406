#include <gtest/gtest.h>

#include "relay/inbound_message.hpp"

TEST(MessageTagTest, ReadsQuotedTagCaseInsensitively) {
  EXPECT_EQ(relay::ReadMessageTag(R"(["ping","latency"])"), "ping");
  EXPECT_EQ(relay::ReadMessageTag(R"(["DIRECT",{}])"), "direct");
  EXPECT_EQ(relay::ReadMessageTag(R"([ "gs" , 1])"), "gs");
}

TEST(MessageTagTest, MissingOrUnquotedTagIsEmpty) {
  EXPECT_EQ(relay::ReadMessageTag(R"(["ping"])"), "");
  EXPECT_EQ(relay::ReadMessageTag("[ping,1]"), "");
  EXPECT_EQ(relay::ReadMessageTag(""), "");
  EXPECT_EQ(relay::ReadMessageTag("x"), "");
}

TEST(InboundMessageTest, ClassifiesPing) {
  auto message = relay::DecodeInbound(R"(["Ping",["host","latency"]])");
  ASSERT_TRUE(std::holds_alternative<relay::PingMessage>(message));
  EXPECT_EQ(std::get<relay::PingMessage>(message).raw, R"(["Ping",["host","latency"]])");
}

TEST(InboundMessageTest, ClassifiesDirectTargets) {
  auto message = relay::DecodeInbound(R"(["direct",{"p1":["a"],"p2":7}])");
  ASSERT_TRUE(std::holds_alternative<relay::DirectMessage>(message));
  const auto& targets = std::get<relay::DirectMessage>(message).targets;
  EXPECT_EQ(targets["p1"], nlohmann::json::array({"a"}));
  EXPECT_EQ(targets["p2"], 7);
}

TEST(InboundMessageTest, MalformedDirectIsReported) {
  EXPECT_TRUE(std::holds_alternative<relay::MalformedMessage>(relay::DecodeInbound(R"(["direct",{"p1":)")));
  EXPECT_TRUE(std::holds_alternative<relay::MalformedMessage>(relay::DecodeInbound(R"(["direct","p1"])")));
  EXPECT_TRUE(std::holds_alternative<relay::MalformedMessage>(relay::DecodeInbound(R"(["direct",[1,2]])")));
}

TEST(InboundMessageTest, EverythingElseIsBroadcastUnchanged) {
  for (const std::string raw : {R"(["gs",{"phase":1}])", "not json at all", R"(["ping"])", "{}"}) {
    auto message = relay::DecodeInbound(raw);
    ASSERT_TRUE(std::holds_alternative<relay::BroadcastMessage>(message)) << raw;
    EXPECT_EQ(std::get<relay::BroadcastMessage>(message).raw, raw);
  }
}

TEST(PingRewriteTest, ReplacesQuotedLatencyToken) {
  EXPECT_EQ(relay::RewritePingLatency(R"(["ping","latency"])", 0), R"(["ping",0])");
  EXPECT_EQ(relay::RewritePingLatency(R"(["ping", [3, "latency"]])", 42), R"(["ping", [3, 42]])");
}

TEST(PingRewriteTest, SkipsLatencyUsedAsObjectKey) {
  EXPECT_EQ(relay::RewritePingLatency(R"(["ping",{"latency":1}])", 7), R"(["ping",{"latency":1}])");
  EXPECT_EQ(relay::RewritePingLatency(R"(["ping",{"latency" : 1},"latency"])", 7), R"(["ping",{"latency" : 1},7])");
}

TEST(PingRewriteTest, FallsBackToBareText) {
  EXPECT_EQ(relay::RewritePingLatency(R"(["ping",latency])", 5), R"(["ping",5])");
}

TEST(PingRewriteTest, LeavesPayloadWithoutLatencyUntouched) {
  EXPECT_EQ(relay::RewritePingLatency(R"(["ping",1])", 9), R"(["ping",1])");
}
