/*
 * 설명: 요청 경로의 마지막 두 세그먼트를 플레이어/채널 ID로 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/path_identity_test.cpp
 */
#include "relay/path_identity.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace relay {
namespace {
std::string ToLower(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> segments;
  std::size_t pos = 0;
  while (true) {
    auto slash = path.find('/', pos);
    segments.push_back(path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos));
    if (slash == std::string::npos) {
      break;
    }
    pos = slash + 1;
  }
  return segments;
}
}  // namespace

PeerIdentity ParsePeerIdentity(std::string_view target) {
  auto qpos = target.find('?');
  auto segments = SplitPath(ToLower(target.substr(0, qpos)));

  PeerIdentity identity;
  identity.player_id = segments.back();
  segments.pop_back();
  if (!segments.empty()) {
    identity.channel_id = segments.back();
  }
  return identity;
}

}  // namespace relay
