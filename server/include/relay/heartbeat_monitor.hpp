/*
 * 설명: 주기적으로 모든 연결에 핑을 보내고 응답하지 않은 연결을 강제 종료한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_service_test.cpp
 */
#pragma once

#include <cstddef>

#include "relay/channel_registry.hpp"
#include "relay/observability.hpp"

namespace relay {

struct HeartbeatReport {
  std::size_t probed{0};
  std::size_t terminated{0};
};

class HeartbeatMonitor {
 public:
  HeartbeatMonitor(ChannelRegistry& registry, Observability& observability);

  HeartbeatReport Tick(Clock::time_point now);
  ProbeResult OnProbeResponse(Connection& connection, Clock::time_point now);

 private:
  ChannelRegistry& registry_;
  Observability& observability_;
};

}  // namespace relay
