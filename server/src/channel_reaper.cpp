/*
 * 설명: OPEN/CONNECTING 멤버가 남지 않은 채널과 그 채널 게이지를 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_service_test.cpp
 */
#include "relay/channel_reaper.hpp"

namespace relay {

ChannelReaper::ChannelReaper(ChannelRegistry& registry, Observability& observability)
    : registry_(registry), observability_(observability) {}

std::vector<std::string> ChannelReaper::Sweep() {
  std::vector<std::string> removed;
  for (const auto& channel_id : registry_.ChannelIds()) {
    if (registry_.LiveMemberCount(channel_id) > 0) {
      continue;
    }
    registry_.EraseChannel(channel_id);
    observability_.RemoveChannel(channel_id);
    removed.push_back(channel_id);
  }
  if (!removed.empty()) {
    observability_.Log(LogContext{LogLevel::kDebug, "channel.reaped", std::nullopt, std::nullopt,
                                  "count=" + std::to_string(removed.size())});
  }
  return removed;
}

}  // namespace relay
