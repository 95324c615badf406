/*
 * 설명: 구조화 로그를 출력하고 릴레이 메트릭 스냅샷을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "relay/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace relay {
namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

nlohmann::json ToJson(const MetricsSnapshot& snapshot) {
  nlohmann::json channels = nlohmann::json::object();
  for (const auto& [name, count] : snapshot.channel_players) {
    channels[name] = count;
  }
  return {{"labels", {{"app", kAppLabel}}},
          {"players_concurrent", snapshot.players_concurrent},
          {"channels_concurrent", snapshot.channels_concurrent},
          {"channel_players", channels},
          {"messages_incoming", snapshot.messages_incoming},
          {"messages_outgoing", snapshot.messages_outgoing},
          {"connection_terminated_host", snapshot.connection_terminated_host},
          {"connection_terminated_spam", snapshot.connection_terminated_spam},
          {"connection_terminated_timeout", snapshot.connection_terminated_timeout}};
}

void Observability::SetChannelPlayers(const std::string& channel, std::uint64_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  channel_players_[channel] = count;
}

void Observability::RemoveChannel(const std::string& channel) {
  std::lock_guard<std::mutex> lock(mutex_);
  channel_players_.erase(channel);
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.players_concurrent = players_concurrent_.load();
  snapshot.channels_concurrent = channels_concurrent_.load();
  snapshot.messages_incoming = messages_incoming_.load();
  snapshot.messages_outgoing = messages_outgoing_.load();
  snapshot.connection_terminated_host = terminated_host_.load();
  snapshot.connection_terminated_spam = terminated_spam_.load();
  snapshot.connection_terminated_timeout = terminated_timeout_.load();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.channel_players = channel_players_;
  }
  return snapshot;
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::Log(const LogContext& ctx) {
  if (ctx.level < threshold_) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LevelName(ctx.level);
  log_json["traceId"] = NextTraceId();
  log_json["eventName"] = ctx.name;
  if (ctx.channel) {
    log_json["channel"] = *ctx.channel;
  }
  if (ctx.player_id) {
    log_json["playerId"] = *ctx.player_id;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  std::cout << log_json.dump() << std::endl;
}

}  // namespace relay
