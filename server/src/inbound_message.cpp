/*
 * 설명: 수신 메시지 엔벨로프를 해석하고 ping 지연 시간 필드를 치환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/inbound_message_test.cpp
 */
#include "relay/inbound_message.hpp"

#include <algorithm>
#include <cctype>

namespace relay {
namespace {
constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view Trim(std::string_view value) {
  auto begin = value.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = value.find_last_not_of(kWhitespace);
  return value.substr(begin, end - begin + 1);
}
}  // namespace

std::string ReadMessageTag(std::string_view raw) {
  if (raw.size() < 2) {
    return {};
  }
  auto head = raw.substr(1);
  auto comma = head.find(',');
  if (comma == std::string_view::npos) {
    return {};
  }
  auto quoted = Trim(head.substr(0, comma));
  if (quoted.size() < 2 || quoted.front() != '"' || quoted.back() != '"') {
    return {};
  }
  std::string tag(quoted.substr(1, quoted.size() - 2));
  std::transform(tag.begin(), tag.end(), tag.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return tag;
}

InboundMessage DecodeInbound(std::string raw) {
  auto tag = ReadMessageTag(raw);
  if (tag == "ping") {
    return PingMessage{std::move(raw)};
  }
  if (tag != "direct") {
    return BroadcastMessage{std::move(raw)};
  }

  try {
    auto parsed = nlohmann::json::parse(raw);
    if (!parsed.is_array() || parsed.size() < 2) {
      return MalformedMessage{"direct 메시지에 대상 목록이 없습니다"};
    }
    if (!parsed[1].is_object()) {
      return MalformedMessage{"direct 대상 목록이 객체가 아닙니다"};
    }
    return DirectMessage{std::move(parsed[1])};
  } catch (const nlohmann::json::exception& ex) {
    return MalformedMessage{ex.what()};
  }
}

namespace {

// 뒤따르는 첫 비공백 문자가 ':'이면 객체 키다.
bool IsObjectKey(std::string_view raw, std::size_t end) {
  auto next = raw.find_first_not_of(" \t\r\n", end);
  return next != std::string_view::npos && raw[next] == ':';
}

}  // namespace

std::string RewritePingLatency(std::string_view raw, long latency_ms) {
  std::string rewritten(raw);
  auto value = std::to_string(latency_ms);
  constexpr std::string_view kQuoted = "\"latency\"";
  for (auto pos = raw.find(kQuoted); pos != std::string_view::npos; pos = raw.find(kQuoted, pos + 1)) {
    if (!IsObjectKey(raw, pos + kQuoted.size())) {
      rewritten.replace(pos, kQuoted.size(), value);
      return rewritten;
    }
  }
  constexpr std::string_view kBare = "latency";
  for (auto pos = raw.find(kBare); pos != std::string_view::npos; pos = raw.find(kBare, pos + 1)) {
    auto end = pos + kBare.size();
    bool quoted = pos > 0 && raw[pos - 1] == '"' && end < raw.size() && raw[end] == '"';
    if (!quoted) {
      rewritten.replace(pos, kBare.size(), value);
      break;
    }
  }
  return rewritten;
}

}  // namespace relay
