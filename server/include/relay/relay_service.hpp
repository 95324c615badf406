/*
 * 설명: 채널 레지스트리, 라우터, 하트비트 모니터, 채널 리퍼를 하나의 잠금 아래에서 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_service_test.cpp, server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "relay/channel_reaper.hpp"
#include "relay/channel_registry.hpp"
#include "relay/heartbeat_monitor.hpp"
#include "relay/message_router.hpp"
#include "relay/observability.hpp"
#include "relay/path_identity.hpp"
#include "relay/transport.hpp"

namespace relay {

enum class AdmissionStatus { kAdmitted, kHostConflict };

struct AdmissionResult {
  AdmissionStatus status{AdmissionStatus::kAdmitted};
  ConnectionPtr connection;
};

struct TickReport {
  HeartbeatReport heartbeat;
  std::vector<std::string> reaped_channels;
};

std::string HostConflictReason(const std::string& channel_id);

class RelayService : public std::enable_shared_from_this<RelayService> {
 public:
  RelayService(boost::asio::io_context& ioc, std::shared_ptr<Observability> observability,
               std::chrono::seconds heartbeat_interval, std::uint64_t spam_messages_per_second);

  AdmissionResult Admit(const PeerIdentity& identity, const std::shared_ptr<ClientTransport>& transport,
                        Clock::time_point now);
  RouteOutcome HandleMessage(const ConnectionPtr& sender, std::string raw);
  ProbeResult HandleProbeResponse(const ConnectionPtr& connection, Clock::time_point now);
  void HandleDisconnect(const ConnectionPtr& connection);
  // 하트비트를 먼저 처리한 뒤 채널을 정리한다.
  TickReport Tick(Clock::time_point now);

  void Start();
  void Stop();

  std::uint64_t SpamLimit() const { return router_.SpamLimit(); }
  bool HasChannel(const std::string& channel_id) const;
  std::vector<ConnectionPtr> Members(const std::string& channel_id) const;
  std::size_t ChannelCount() const;
  std::size_t ConnectionCount() const;

 private:
  void RefreshGauges(const std::string& channel_id);
  void ScheduleTick();
  void OnTick(const boost::system::error_code& ec);

  std::shared_ptr<Observability> observability_;
  std::chrono::seconds heartbeat_interval_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  std::atomic<bool> running_{false};
  mutable std::mutex mutex_;
  ChannelRegistry registry_;
  MessageRouter router_;
  HeartbeatMonitor monitor_;
  ChannelReaper reaper_;
};

}  // namespace relay
