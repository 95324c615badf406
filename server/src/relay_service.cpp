/*
 * 설명: 입장 판정, 메시지 라우팅, 핑 응답, 연결 종료, 주기 틱을 직렬화해 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_service_test.cpp, server/tests/e2e/relay_flow_test.cpp
 */
#include "relay/relay_service.hpp"

#include <stdexcept>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

namespace relay {

std::string HostConflictReason(const std::string& channel_id) {
  return "The channel \"" + channel_id + "\" already has a host";
}

RelayService::RelayService(boost::asio::io_context& ioc, std::shared_ptr<Observability> observability,
                           std::chrono::seconds heartbeat_interval, std::uint64_t spam_messages_per_second)
    : observability_(std::move(observability)), heartbeat_interval_(heartbeat_interval),
      strand_(boost::asio::make_strand(ioc)), timer_(strand_),
      router_(registry_, *observability_,
              spam_messages_per_second * static_cast<std::uint64_t>(heartbeat_interval.count())),
      monitor_(registry_, *observability_), reaper_(registry_, *observability_) {
  if (heartbeat_interval.count() <= 0 || spam_messages_per_second == 0) {
    throw std::invalid_argument("heartbeat interval and spam rate must be positive");
  }
}

AdmissionResult RelayService::Admit(const PeerIdentity& identity, const std::shared_ptr<ClientTransport>& transport,
                                    Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (identity.player_id == kHostPlayerId && registry_.HasOpenHost(identity.channel_id)) {
    observability_->Log(LogContext{LogLevel::kInfo, "connection.duplicate_host", identity.channel_id,
                                   identity.player_id, "이미 호스트가 있는 채널입니다"});
    transport->Close(HostConflictReason(identity.channel_id));
    observability_->IncrementTerminatedHost();
    return AdmissionResult{AdmissionStatus::kHostConflict, nullptr};
  }

  auto connection = std::make_shared<Connection>(identity.channel_id, identity.player_id, transport, now);
  registry_.Join(connection);
  connection->Ping();
  RefreshGauges(identity.channel_id);
  observability_->Log(LogContext{LogLevel::kDebug, "connection.joined", identity.channel_id, identity.player_id, ""});
  return AdmissionResult{AdmissionStatus::kAdmitted, connection};
}

RouteOutcome RelayService::HandleMessage(const ConnectionPtr& sender, std::string raw) {
  std::lock_guard<std::mutex> lock(mutex_);
  return router_.Route(sender, std::move(raw));
}

ProbeResult RelayService::HandleProbeResponse(const ConnectionPtr& connection, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  return monitor_.OnProbeResponse(*connection, now);
}

void RelayService::HandleDisconnect(const ConnectionPtr& connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (registry_.Remove(connection.get())) {
    observability_->Log(LogContext{LogLevel::kDebug, "connection.left", connection->ChannelId(),
                                   connection->PlayerId(), ""});
  }
  RefreshGauges(connection->ChannelId());
}

TickReport RelayService::Tick(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  TickReport report;
  report.heartbeat = monitor_.Tick(now);
  report.reaped_channels = reaper_.Sweep();
  for (const auto& channel_id : registry_.ChannelIds()) {
    RefreshGauges(channel_id);
  }
  observability_->SetChannelsConcurrent(registry_.ChannelCount());
  observability_->SetPlayersConcurrent(registry_.ConnectionCount());
  return report;
}

void RelayService::Start() {
  if (running_.exchange(true)) {
    return;
  }
  boost::asio::post(strand_, [self = shared_from_this()]() { self->ScheduleTick(); });
}

void RelayService::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  boost::asio::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
}

void RelayService::ScheduleTick() {
  if (!running_) {
    return;
  }
  timer_.expires_after(heartbeat_interval_);
  timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code& ec) { self->OnTick(ec); }));
}

void RelayService::OnTick(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  auto report = Tick(Clock::now());
  if (report.heartbeat.terminated > 0 || !report.reaped_channels.empty()) {
    observability_->Log(LogContext{LogLevel::kInfo, "heartbeat.tick", std::nullopt, std::nullopt,
                                   "terminated=" + std::to_string(report.heartbeat.terminated) +
                                       " reaped=" + std::to_string(report.reaped_channels.size())});
  }
  ScheduleTick();
}

bool RelayService::HasChannel(const std::string& channel_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.Contains(channel_id);
}

std::vector<ConnectionPtr> RelayService::Members(const std::string& channel_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.Members(channel_id);
}

std::size_t RelayService::ChannelCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.ChannelCount();
}

std::size_t RelayService::ConnectionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.ConnectionCount();
}

void RelayService::RefreshGauges(const std::string& channel_id) {
  if (registry_.Contains(channel_id)) {
    observability_->SetChannelPlayers(channel_id, registry_.LiveMemberCount(channel_id));
  }
  observability_->SetChannelsConcurrent(registry_.ChannelCount());
  observability_->SetPlayersConcurrent(registry_.ConnectionCount());
}

}  // namespace relay
