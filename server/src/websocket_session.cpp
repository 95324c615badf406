/*
 * 설명: WebSocket 메시지를 읽어 릴레이 코어로 넘기고, 코어의 전송/핑/종료 요청을 스트랜드에서 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp
 */
#include "relay/websocket_session.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace relay {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   PeerIdentity identity, std::shared_ptr<RelayService> relay,
                                   std::size_t max_queue_messages, std::size_t max_queue_bytes)
    : ws_(std::move(ws)), identity_(std::move(identity)), relay_(std::move(relay)),
      max_queue_messages_(max_queue_messages), max_queue_bytes_(max_queue_bytes) {}

void WebSocketSession::Run() {
  ws_.control_callback([this](boost::beast::websocket::frame_type kind, boost::beast::string_view) {
    OnControlFrame(kind);
  });
  state_ = ReadyState::kOpen;
  auto admission = relay_->Admit(identity_, shared_from_this(), Clock::now());
  if (admission.status == AdmissionStatus::kAdmitted) {
    connection_ = admission.connection;
  }
  DoRead();
}

void WebSocketSession::Send(std::string message) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
    self->EnqueueMessage(std::move(message));
  });
}

void WebSocketSession::Ping() {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() { self->DoPing(); });
}

void WebSocketSession::Close(const std::string& reason) {
  auto expected = ReadyState::kOpen;
  if (!state_.compare_exchange_strong(expected, ReadyState::kClosing)) {
    return;
  }
  boost::beast::websocket::close_reason close_reason{boost::beast::websocket::close_code::normal};
  // 종료 프레임 사유는 123바이트로 제한된다.
  auto length = std::min(reason.size(), close_reason.reason.max_size());
  close_reason.reason = boost::beast::string_view(reason.data(), length);
  boost::asio::post(ws_.get_executor(),
                    [self = shared_from_this(), close_reason]() { self->DoClose(close_reason); });
}

void WebSocketSession::Terminate() {
  if (state_.exchange(ReadyState::kClosing) == ReadyState::kClosed) {
    state_ = ReadyState::kClosed;
    return;
  }
  boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() { self->DoTerminate(); });
}

void WebSocketSession::DoRead() {
  if (state_ == ReadyState::kClosed) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    MarkClosed();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  if (connection_) {
    relay_->HandleMessage(connection_, std::move(data));
  }
  DoRead();
}

void WebSocketSession::OnControlFrame(boost::beast::websocket::frame_type kind) {
  if (kind == boost::beast::websocket::frame_type::pong && connection_) {
    relay_->HandleProbeResponse(connection_, Clock::now());
  }
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_ || state_ != ReadyState::kOpen) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    auto expected = ReadyState::kOpen;
    if (state_.compare_exchange_strong(expected, ReadyState::kClosing)) {
      boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
      reason.reason = "backpressure_exceeded";
      DoClose(reason);
    }
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::DoPing() {
  if (closing_ || ping_pending_ || state_ != ReadyState::kOpen) {
    return;
  }
  ping_pending_ = true;
  auto self = shared_from_this();
  ws_.async_ping({}, [self](boost::beast::error_code ec) {
    self->ping_pending_ = false;
    if (!ec && self->close_after_ping_) {
      auto reason = *self->close_after_ping_;
      self->close_after_ping_.reset();
      self->DoClose(reason);
    }
  });
}

void WebSocketSession::DoClose(boost::beast::websocket::close_reason reason) {
  if (closing_) {
    return;
  }
  // 핑과 종료 프레임은 동시에 진행할 수 없다.
  if (ping_pending_) {
    close_after_ping_ = reason;
    return;
  }
  closing_ = true;
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) { self->MarkClosed(); });
}

void WebSocketSession::DoTerminate() {
  closing_ = true;
  boost::beast::error_code ec;
  boost::beast::get_lowest_layer(ws_).socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  boost::beast::get_lowest_layer(ws_).close();
  MarkClosed();
}

void WebSocketSession::MarkClosed() {
  state_ = ReadyState::kClosed;
  if (connection_ && !disconnect_reported_) {
    disconnect_reported_ = true;
    relay_->HandleDisconnect(connection_);
  }
}

}  // namespace relay
