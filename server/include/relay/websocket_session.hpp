/*
 * 설명: WebSocket 연결을 릴레이 코어의 전송 계층으로 노출하고 읽기/쓰기/핑/종료를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "relay/path_identity.hpp"
#include "relay/relay_service.hpp"
#include "relay/transport.hpp"

namespace relay {

class WebSocketSession : public ClientTransport, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, PeerIdentity identity,
                   std::shared_ptr<RelayService> relay, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);

  // 업그레이드가 끝난 뒤 스트림의 스트랜드 위에서 호출한다.
  void Run();

  ReadyState State() const override { return state_.load(); }
  void Send(std::string message) override;
  void Ping() override;
  void Close(const std::string& reason) override;
  void Terminate() override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void OnControlFrame(boost::beast::websocket::frame_type kind);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void DoPing();
  void DoClose(boost::beast::websocket::close_reason reason);
  void DoTerminate();
  void MarkClosed();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  PeerIdentity identity_;
  std::shared_ptr<RelayService> relay_;
  ConnectionPtr connection_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool ping_pending_{false};
  bool disconnect_reported_{false};
  std::optional<boost::beast::websocket::close_reason> close_after_ping_;
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
  std::atomic<ReadyState> state_{ReadyState::kConnecting};
};

}  // namespace relay
