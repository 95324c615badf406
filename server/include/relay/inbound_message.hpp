/*
 * 설명: 수신 페이로드의 메시지 태그를 읽어 ping/direct/broadcast로 분류한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/inbound_message_test.cpp
 */
#pragma once

#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace relay {

struct PingMessage {
  std::string raw;
};

struct DirectMessage {
  // playerId -> 전달할 하위 페이로드
  nlohmann::json targets;
};

struct BroadcastMessage {
  std::string raw;
};

struct MalformedMessage {
  std::string reason;
};

using InboundMessage = std::variant<PingMessage, DirectMessage, BroadcastMessage, MalformedMessage>;

// 첫 문자 다음부터 첫 쉼표 전까지를 따옴표로 감싼 태그로 본다. 대소문자는 구분하지 않는다.
std::string ReadMessageTag(std::string_view raw);

InboundMessage DecodeInbound(std::string raw);

// 첫 번째 "latency" 문자열 토큰(없으면 latency 텍스트)을 정수로 치환한다.
std::string RewritePingLatency(std::string_view raw, long latency_ms);

}  // namespace relay
