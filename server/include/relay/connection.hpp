/*
 * 설명: 채널에 참여한 클라이언트 한 명의 식별자, 생존 여부, 지연 시간, 메시지 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_test.cpp, server/tests/unit/relay_service_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "relay/transport.hpp"

namespace relay {

using Clock = std::chrono::steady_clock;

inline constexpr const char* kHostPlayerId = "host";

struct ProbeResult {
  long latency_ms{0};
};

class Connection {
 public:
  Connection(std::string channel_id, std::string player_id, std::weak_ptr<ClientTransport> transport,
             Clock::time_point now);

  const std::string& ChannelId() const { return channel_id_; }
  const std::string& PlayerId() const { return player_id_; }
  bool IsHost() const { return player_id_ == kHostPlayerId; }
  bool IsAlive() const { return alive_; }
  long LatencyMs() const { return latency_ms_; }
  std::uint64_t MessageCounter() const { return message_counter_; }
  Clock::time_point ProbeIssuedAt() const { return probe_issued_at_; }

  // 전송 객체가 이미 해제되었으면 kClosed로 본다.
  ReadyState State() const;
  bool IsOpen() const { return State() == ReadyState::kOpen; }
  bool IsOpenOrConnecting() const;

  void Ping();
  void IssueProbe(Clock::time_point now);
  ProbeResult OnProbeResponse(Clock::time_point now);
  // 카운터를 올리고 limit 이하이면 true.
  bool CountInbound(std::uint64_t limit);

  void Send(std::string message);
  void Close(const std::string& reason);
  void Terminate();

 private:
  std::string channel_id_;
  std::string player_id_;
  std::weak_ptr<ClientTransport> transport_;
  bool alive_{true};
  Clock::time_point probe_issued_at_;
  long latency_ms_{0};
  std::uint64_t message_counter_{0};
};

}  // namespace relay
