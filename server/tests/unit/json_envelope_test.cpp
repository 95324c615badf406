#include <gtest/gtest.h>

#include "relay/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = relay::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env["meta"].contains("timestamp"));
  EXPECT_EQ(env["meta"]["app"], "clocktower-online");
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = relay::MakeErrorEnvelope("not_found", "없음");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "not_found");
  EXPECT_EQ(env["error"]["message"], "없음");
  EXPECT_TRUE(env["error"].contains("detail"));
}
