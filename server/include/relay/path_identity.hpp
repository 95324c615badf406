/*
 * 설명: WebSocket 요청 경로에서 채널 ID와 플레이어 ID를 추출한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/path_identity_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

namespace relay {

struct PeerIdentity {
  std::string channel_id;
  std::string player_id;
};

// 쿼리 문자열을 제외한 경로를 소문자로 바꾼 뒤 마지막 두 세그먼트를 뒤에서부터 읽는다.
PeerIdentity ParsePeerIdentity(std::string_view target);

}  // namespace relay
