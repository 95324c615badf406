#pragma once

#include <optional>
#include <string>
#include <vector>

#include "relay/transport.hpp"

namespace relay::fakes {

// 전송 요청을 기록만 하는 메모리 전송 계층.
class FakeTransport : public ClientTransport {
 public:
  ReadyState State() const override { return state; }
  void Send(std::string message) override { sent.push_back(std::move(message)); }
  void Ping() override { ++pings; }
  void Close(const std::string& reason) override {
    close_reason = reason;
    state = ReadyState::kClosing;
  }
  void Terminate() override {
    terminated = true;
    state = ReadyState::kClosed;
  }

  ReadyState state{ReadyState::kOpen};
  std::vector<std::string> sent;
  int pings{0};
  std::optional<std::string> close_reason;
  bool terminated{false};
};

}  // namespace relay::fakes
