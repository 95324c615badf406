#include <gtest/gtest.h>

#include <memory>

#include "fake_transport.hpp"
#include "relay/connection.hpp"

namespace {

using relay::Clock;
using relay::Connection;
using relay::ReadyState;
using relay::fakes::FakeTransport;

}  // namespace

TEST(ConnectionTest, StartsAliveWithZeroLatency) {
  auto transport = std::make_shared<FakeTransport>();
  auto now = Clock::now();
  Connection connection("game1", "host", transport, now);

  EXPECT_TRUE(connection.IsHost());
  EXPECT_TRUE(connection.IsAlive());
  EXPECT_EQ(connection.LatencyMs(), 0);
  EXPECT_EQ(connection.MessageCounter(), 0u);
  EXPECT_EQ(connection.ProbeIssuedAt(), now);
  EXPECT_EQ(connection.State(), ReadyState::kOpen);
}

TEST(ConnectionTest, ProbeResponseHalvesRoundTripAndResetsCounter) {
  auto transport = std::make_shared<FakeTransport>();
  auto start = Clock::now();
  Connection connection("game1", "p1", transport, start);

  connection.IssueProbe(start);
  EXPECT_FALSE(connection.IsAlive());
  EXPECT_EQ(transport->pings, 1);

  EXPECT_TRUE(connection.CountInbound(10));
  EXPECT_TRUE(connection.CountInbound(10));
  auto result = connection.OnProbeResponse(start + std::chrono::milliseconds(15));

  EXPECT_EQ(result.latency_ms, 8);
  EXPECT_EQ(connection.LatencyMs(), 8);
  EXPECT_EQ(connection.MessageCounter(), 0u);
  EXPECT_TRUE(connection.IsAlive());
}

TEST(ConnectionTest, CountInboundFailsOnlyAfterLimit) {
  auto transport = std::make_shared<FakeTransport>();
  Connection connection("game1", "p1", transport, Clock::now());

  for (int i = 0; i < 3; ++i) {
    EXPECT_TRUE(connection.CountInbound(3));
  }
  EXPECT_FALSE(connection.CountInbound(3));
}

TEST(ConnectionTest, ReleasedTransportReadsAsClosed) {
  auto transport = std::make_shared<FakeTransport>();
  Connection connection("game1", "p1", transport, Clock::now());
  transport.reset();

  EXPECT_EQ(connection.State(), ReadyState::kClosed);
  EXPECT_FALSE(connection.IsOpenOrConnecting());
  connection.Send("ignored");
  connection.Terminate();
}

TEST(ConnectionTest, ConnectingCountsAsLive) {
  auto transport = std::make_shared<FakeTransport>();
  transport->state = ReadyState::kConnecting;
  Connection connection("game1", "p1", transport, Clock::now());

  EXPECT_FALSE(connection.IsOpen());
  EXPECT_TRUE(connection.IsOpenOrConnecting());
}
