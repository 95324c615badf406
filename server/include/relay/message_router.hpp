/*
 * 설명: 수신 메시지를 같은 채널의 수신자 집합으로 라우팅하고 스팸 제한을 적용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_service_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "relay/channel_registry.hpp"
#include "relay/inbound_message.hpp"
#include "relay/observability.hpp"

namespace relay {

inline constexpr const char* kSpamCloseReason =
    "Your app seems to be malfunctioning, please clear your browser cache.";

enum class RouteStatus { kRouted, kSenderNotOpen, kSpamClosed, kDropped };

struct RouteOutcome {
  RouteStatus status{RouteStatus::kRouted};
  std::size_t deliveries{0};
};

class MessageRouter {
 public:
  MessageRouter(ChannelRegistry& registry, Observability& observability, std::uint64_t spam_limit);

  RouteOutcome Route(const ConnectionPtr& sender, std::string raw);
  std::uint64_t SpamLimit() const { return spam_limit_; }

 private:
  std::size_t DeliverPing(const ConnectionPtr& sender, const PingMessage& message);
  std::size_t DeliverDirect(const ConnectionPtr& sender, const DirectMessage& message);
  std::size_t DeliverBroadcast(const ConnectionPtr& sender, const BroadcastMessage& message);

  ChannelRegistry& registry_;
  Observability& observability_;
  std::uint64_t spam_limit_;
};

}  // namespace relay
