/*
 * 설명: ping/direct/broadcast 메시지를 채널 멤버에게 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_service_test.cpp
 */
#include "relay/message_router.hpp"

namespace relay {

MessageRouter::MessageRouter(ChannelRegistry& registry, Observability& observability, std::uint64_t spam_limit)
    : registry_(registry), observability_(observability), spam_limit_(spam_limit) {}

RouteOutcome MessageRouter::Route(const ConnectionPtr& sender, std::string raw) {
  observability_.IncrementIncoming();
  if (!sender->IsOpen()) {
    return RouteOutcome{RouteStatus::kSenderNotOpen, 0};
  }

  if (!sender->CountInbound(spam_limit_)) {
    observability_.Log(LogContext{LogLevel::kWarn, "connection.spam", sender->ChannelId(), sender->PlayerId(),
                                  "메시지 한도 초과로 연결을 종료합니다"});
    sender->Close(kSpamCloseReason);
    observability_.IncrementTerminatedSpam();
    return RouteOutcome{RouteStatus::kSpamClosed, 0};
  }

  auto message = DecodeInbound(std::move(raw));
  if (const auto* ping = std::get_if<PingMessage>(&message)) {
    return RouteOutcome{RouteStatus::kRouted, DeliverPing(sender, *ping)};
  }
  if (const auto* direct = std::get_if<DirectMessage>(&message)) {
    return RouteOutcome{RouteStatus::kRouted, DeliverDirect(sender, *direct)};
  }
  if (const auto* broadcast = std::get_if<BroadcastMessage>(&message)) {
    return RouteOutcome{RouteStatus::kRouted, DeliverBroadcast(sender, *broadcast)};
  }

  const auto& malformed = std::get<MalformedMessage>(message);
  observability_.Log(LogContext{LogLevel::kWarn, "message.direct_malformed", sender->ChannelId(),
                                sender->PlayerId(), malformed.reason});
  return RouteOutcome{RouteStatus::kDropped, 0};
}

std::size_t MessageRouter::DeliverPing(const ConnectionPtr& sender, const PingMessage& message) {
  std::size_t delivered = 0;
  for (const auto& receiver : registry_.Members(sender->ChannelId())) {
    if (receiver == sender || !receiver->IsOpen()) {
      continue;
    }
    // 핑은 호스트와 플레이어 사이에서만 오간다.
    if (!sender->IsHost() && !receiver->IsHost()) {
      continue;
    }
    receiver->Send(RewritePingLatency(message.raw, receiver->LatencyMs() + sender->LatencyMs()));
    observability_.IncrementOutgoing();
    ++delivered;
  }
  return delivered;
}

std::size_t MessageRouter::DeliverDirect(const ConnectionPtr& sender, const DirectMessage& message) {
  std::size_t delivered = 0;
  for (const auto& receiver : registry_.Members(sender->ChannelId())) {
    if (receiver == sender || !receiver->IsOpen()) {
      continue;
    }
    auto target = message.targets.find(receiver->PlayerId());
    if (target == message.targets.end()) {
      continue;
    }
    receiver->Send(target->dump());
    observability_.IncrementOutgoing();
    ++delivered;
  }
  return delivered;
}

std::size_t MessageRouter::DeliverBroadcast(const ConnectionPtr& sender, const BroadcastMessage& message) {
  std::size_t delivered = 0;
  for (const auto& receiver : registry_.Members(sender->ChannelId())) {
    if (receiver == sender || !receiver->IsOpen()) {
      continue;
    }
    receiver->Send(message.raw);
    observability_.IncrementOutgoing();
    ++delivered;
  }
  return delivered;
}

}  // namespace relay
