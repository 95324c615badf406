/*
 * 설명: 살아 있는 멤버가 없는 채널을 레지스트리에서 제거한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_service_test.cpp
 */
#pragma once

#include <string>
#include <vector>

#include "relay/channel_registry.hpp"
#include "relay/observability.hpp"

namespace relay {

class ChannelReaper {
 public:
  ChannelReaper(ChannelRegistry& registry, Observability& observability);

  // 제거한 채널 ID 목록을 돌려준다.
  std::vector<std::string> Sweep();

 private:
  ChannelRegistry& registry_;
  Observability& observability_;
};

}  // namespace relay
