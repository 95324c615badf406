/*
 * 설명: 릴레이 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace relay {

struct RelayConfig {
  unsigned short port;
  bool development;
  std::size_t heartbeat_interval_seconds;
  std::size_t spam_messages_per_second;
  std::string allowed_origin_pattern;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::string log_level;
  bool metrics_enabled;
};

RelayConfig LoadConfigFromEnv();

}  // namespace relay
