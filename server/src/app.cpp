/*
 * 설명: 릴레이 서버 수명주기와 리스닝 스레드, 환경설정 로딩을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp, server/tests/unit/config_test.cpp
 */
#include "relay/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "relay/http_session.hpp"

namespace relay {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const RelayConfig& config,
           std::shared_ptr<const OriginPolicy> origin_policy, std::shared_ptr<RelayService> relay_service,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config),
        origin_policy_(std::move(origin_policy)), relay_service_(std::move(relay_service)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->origin_policy_,
                                          self->relay_service_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  RelayConfig config_;
  std::shared_ptr<const OriginPolicy> origin_policy_;
  std::shared_ptr<RelayService> relay_service_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const RelayConfig& config)
    : config_(config), ioc_(), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  origin_policy_ = std::make_shared<OriginPolicy>(config.allowed_origin_pattern);
  relay_service_ = std::make_shared<RelayService>(ioc_, observability_,
                                                  std::chrono::seconds(config.heartbeat_interval_seconds),
                                                  config.spam_messages_per_second);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, origin_policy_, relay_service_, observability_);
    listener_->Run();
    relay_service_->Start();
    observability_->Log(LogContext{LogLevel::kInfo, "server.started", std::nullopt, std::nullopt,
                                   "port=" + std::to_string(config_.port)});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->Log(LogContext{LogLevel::kError, "server.failed", std::nullopt, std::nullopt, ex.what()});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  relay_service_->Stop();
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

RelayConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  // 0이면 스팸 한도가 0이 되고 타이머가 쉬지 않고 돈다.
  auto get_positive = [&get_env](const char* key, const char* def) -> std::size_t {
    auto value = static_cast<std::size_t>(std::stoul(get_env(key, def)));
    if (value == 0) {
      throw std::invalid_argument(std::string{key} + " must be greater than zero");
    }
    return value;
  };

  RelayConfig cfg;
  cfg.development = get_env("RELAY_ENV", "production") == "development";
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", cfg.development ? "8081" : "8080")));
  cfg.heartbeat_interval_seconds = get_positive("HEARTBEAT_INTERVAL_SECONDS", "30");
  cfg.spam_messages_per_second = get_positive("SPAM_MESSAGES_PER_SECOND", "5");
  cfg.allowed_origin_pattern = get_env("ALLOWED_ORIGIN_PATTERN", kDefaultOriginPattern);
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "256")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "1048576")));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.metrics_enabled = get_env("METRICS_ENABLED", cfg.development ? "false" : "true") == "true";
  return cfg;
}

}  // namespace relay
