/*
 * 설명: 릴레이 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>
#include <optional>

#include <boost/asio/signal_set.hpp>

#include "relay/app.hpp"
#include "relay/observability.hpp"

int main() {
  using namespace relay;
  try {
    RelayConfig config = LoadConfigFromEnv();
    ServerApp app(config);

    boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
    signals.async_wait([&app](const boost::system::error_code& ec, int) {
      if (!ec) {
        std::cout << "종료 신호 수신, 서버를 정지합니다\n";
        app.GetContext().stop();
      }
    });

    app.Run();
    app.Stop();
  } catch (const std::exception& ex) {
    // 설정 오류(잘못된 정규식, 0 이하 주기 등)는 서버 시작 전에 보고한다.
    Observability(LogLevel::kError)
        .Log(LogContext{LogLevel::kError, "server.config_invalid", std::nullopt, std::nullopt, ex.what()});
    return 1;
  }
  return 0;
}
