/*
 * 설명: WebSocket 업그레이드 요청의 Origin 헤더를 허용 패턴과 대조한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/origin_policy_test.cpp
 */
#pragma once

#include <regex>
#include <string>
#include <string_view>

namespace relay {

inline constexpr const char* kDefaultOriginPattern =
    R"(^https?://([^.]+\.github\.io|localhost|clocktower\.online|eddbra1nprivatetownsquare\.xyz))";

class OriginPolicy {
 public:
  // 잘못된 패턴이면 std::regex_error를 던진다.
  explicit OriginPolicy(const std::string& pattern);

  bool Allows(std::string_view origin) const;

 private:
  std::regex pattern_;
};

}  // namespace relay
