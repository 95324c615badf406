/*
 * 설명: 연결 단위 생존 확인(핑/퐁), 지연 시간 추정, 스팸 카운터를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_test.cpp
 */
#include "relay/connection.hpp"

#include <cmath>

namespace relay {

Connection::Connection(std::string channel_id, std::string player_id, std::weak_ptr<ClientTransport> transport,
                       Clock::time_point now)
    : channel_id_(std::move(channel_id)), player_id_(std::move(player_id)), transport_(std::move(transport)),
      probe_issued_at_(now) {}

ReadyState Connection::State() const {
  auto transport = transport_.lock();
  return transport ? transport->State() : ReadyState::kClosed;
}

bool Connection::IsOpenOrConnecting() const {
  auto state = State();
  return state == ReadyState::kOpen || state == ReadyState::kConnecting;
}

void Connection::Ping() {
  if (auto transport = transport_.lock()) {
    transport->Ping();
  }
}

void Connection::IssueProbe(Clock::time_point now) {
  alive_ = false;
  probe_issued_at_ = now;
  Ping();
}

ProbeResult Connection::OnProbeResponse(Clock::time_point now) {
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - probe_issued_at_);
  latency_ms_ = std::lround(static_cast<double>(elapsed.count()) / 2.0);
  message_counter_ = 0;
  alive_ = true;
  return ProbeResult{latency_ms_};
}

bool Connection::CountInbound(std::uint64_t limit) {
  ++message_counter_;
  return message_counter_ <= limit;
}

void Connection::Send(std::string message) {
  if (auto transport = transport_.lock()) {
    transport->Send(std::move(message));
  }
}

void Connection::Close(const std::string& reason) {
  if (auto transport = transport_.lock()) {
    transport->Close(reason);
  }
}

void Connection::Terminate() {
  if (auto transport = transport_.lock()) {
    transport->Terminate();
  }
}

}  // namespace relay
