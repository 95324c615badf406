/*
 * 설명: 릴레이 코어가 클라이언트 연결에 접근하는 전송 계층 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_service_test.cpp
 */
#pragma once

#include <string>

namespace relay {

enum class ReadyState { kConnecting, kOpen, kClosing, kClosed };

// 모든 호출은 즉시 반환해야 한다. 실제 전송은 구현체의 실행기에서 이뤄진다.
class ClientTransport {
 public:
  virtual ~ClientTransport() = default;

  virtual ReadyState State() const = 0;
  virtual void Send(std::string message) = 0;
  virtual void Ping() = 0;
  // 정상 종료(1000) 코드와 사유를 담아 종료 핸드셰이크를 시작한다.
  virtual void Close(const std::string& reason) = 0;
  // 핸드셰이크 없이 소켓을 닫는다.
  virtual void Terminate() = 0;
};

}  // namespace relay
