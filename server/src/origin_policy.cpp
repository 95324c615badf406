/*
 * 설명: Origin 헤더 허용 여부를 판정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/origin_policy_test.cpp
 */
#include "relay/origin_policy.hpp"

namespace relay {

OriginPolicy::OriginPolicy(const std::string& pattern)
    : pattern_(pattern, std::regex::ECMAScript | std::regex::icase) {}

bool OriginPolicy::Allows(std::string_view origin) const {
  if (origin.empty()) {
    return false;
  }
  return std::regex_search(origin.begin(), origin.end(), pattern_);
}

}  // namespace relay
