/*
 * 설명: 릴레이 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "relay/config.hpp"
#include "relay/observability.hpp"
#include "relay/origin_policy.hpp"
#include "relay/relay_service.hpp"

namespace relay {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const RelayConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const RelayConfig& GetConfig() const { return config_; }
  std::shared_ptr<RelayService> GetRelayService() { return relay_service_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  RelayConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<const OriginPolicy> origin_policy_;
  std::shared_ptr<RelayService> relay_service_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace relay
