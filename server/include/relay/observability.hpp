/*
 * 설명: 구조화 로그와 릴레이 카운터/게이지를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_service_test.cpp, server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace relay {

inline constexpr const char* kAppLabel = "clocktower-online";

enum class LogLevel { kDebug, kInfo, kWarn, kError };

LogLevel ParseLogLevel(const std::string& value);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::optional<std::string> channel;
  std::optional<std::string> player_id;
  std::string detail;
};

struct MetricsSnapshot {
  std::uint64_t players_concurrent{0};
  std::uint64_t channels_concurrent{0};
  std::map<std::string, std::uint64_t> channel_players;
  std::uint64_t messages_incoming{0};
  std::uint64_t messages_outgoing{0};
  std::uint64_t connection_terminated_host{0};
  std::uint64_t connection_terminated_spam{0};
  std::uint64_t connection_terminated_timeout{0};
};

nlohmann::json ToJson(const MetricsSnapshot& snapshot);

class Observability {
 public:
  explicit Observability(LogLevel threshold = LogLevel::kInfo) : threshold_(threshold) {}

  void IncrementIncoming() { messages_incoming_.fetch_add(1); }
  void IncrementOutgoing() { messages_outgoing_.fetch_add(1); }
  void IncrementTerminatedHost() { terminated_host_.fetch_add(1); }
  void IncrementTerminatedSpam() { terminated_spam_.fetch_add(1); }
  void IncrementTerminatedTimeout() { terminated_timeout_.fetch_add(1); }

  void SetPlayersConcurrent(std::uint64_t count) { players_concurrent_.store(count); }
  void SetChannelsConcurrent(std::uint64_t count) { channels_concurrent_.store(count); }
  void SetChannelPlayers(const std::string& channel, std::uint64_t count);
  void RemoveChannel(const std::string& channel);

  MetricsSnapshot Snapshot() const;
  std::string NextTraceId();
  void Log(const LogContext& ctx);

 private:
  LogLevel threshold_;
  std::atomic<std::uint64_t> messages_incoming_{0};
  std::atomic<std::uint64_t> messages_outgoing_{0};
  std::atomic<std::uint64_t> terminated_host_{0};
  std::atomic<std::uint64_t> terminated_spam_{0};
  std::atomic<std::uint64_t> terminated_timeout_{0};
  std::atomic<std::uint64_t> players_concurrent_{0};
  std::atomic<std::uint64_t> channels_concurrent_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  std::map<std::string, std::uint64_t> channel_players_;
  mutable std::mutex mutex_;
};

}  // namespace relay
