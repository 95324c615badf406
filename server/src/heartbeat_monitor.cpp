/*
 * 설명: 하트비트 틱마다 생존 여부를 판정하고 새 핑을 발행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_service_test.cpp
 */
#include "relay/heartbeat_monitor.hpp"

namespace relay {

HeartbeatMonitor::HeartbeatMonitor(ChannelRegistry& registry, Observability& observability)
    : registry_(registry), observability_(observability) {}

HeartbeatReport HeartbeatMonitor::Tick(Clock::time_point now) {
  HeartbeatReport report;
  for (const auto& connection : registry_.AllConnections()) {
    if (connection->State() == ReadyState::kClosed) {
      continue;
    }
    if (!connection->IsAlive()) {
      observability_.Log(LogContext{LogLevel::kInfo, "connection.timeout", connection->ChannelId(),
                                    connection->PlayerId(), "핑 응답이 없어 연결을 강제 종료합니다"});
      connection->Terminate();
      observability_.IncrementTerminatedTimeout();
      registry_.Remove(connection.get());
      ++report.terminated;
      continue;
    }
    connection->IssueProbe(now);
    ++report.probed;
  }
  return report;
}

ProbeResult HeartbeatMonitor::OnProbeResponse(Connection& connection, Clock::time_point now) {
  auto result = connection.OnProbeResponse(now);
  observability_.Log(LogContext{LogLevel::kDebug, "connection.pong", connection.ChannelId(), connection.PlayerId(),
                                "latencyMs=" + std::to_string(result.latency_ms)});
  return result;
}

}  // namespace relay
