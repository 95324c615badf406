/*
 * 설명: HTTP 요청을 처리하고 Origin 검사 후 WS 업그레이드를 릴레이 세션으로 넘긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp
 */
#include "relay/http_session.hpp"

#include <chrono>

#include <boost/beast/version.hpp>

#include "relay/api_response.hpp"
#include "relay/path_identity.hpp"
#include "relay/websocket_session.hpp"

namespace relay {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const RelayConfig& config,
                         std::shared_ptr<const OriginPolicy> origin_policy, std::shared_ptr<RelayService> relay,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), origin_policy_(std::move(origin_policy)),
      relay_(std::move(relay)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"},
                           {"channels", relay_->ChannelCount()},
                           {"connections", relay_->ConnectionCount()}};
    auto res = std::make_shared<http::response<http::string_body>>();
    res->result(http::status::ok);
    res->body() = MakeSuccessEnvelope(payload).dump();
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/metrics" && config_.metrics_enabled) {
    auto res = std::make_shared<http::response<http::string_body>>();
    res->result(http::status::ok);
    res->body() = MakeSuccessEnvelope(ToJson(observability_->Snapshot())).dump();
    return SendResponse(res);
  }

  SendError(http::status::not_found, "not_found", "존재하지 않는 경로입니다");
}

void HttpSession::SendError(boost::beast::http::status status, std::string_view code, std::string_view message) {
  auto res = std::make_shared<boost::beast::http::response<boost::beast::http::string_body>>();
  res->result(status);
  res->body() = MakeErrorEnvelope(code, message).dump();
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res) {
  auto self = shared_from_this();
  res->version(req_.version());
  res->set(boost::beast::http::field::server, "townsquare-relay");
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res->keep_alive(false);
  res->prepare_payload();
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  auto origin = req_[boost::beast::http::field::origin];
  if (!origin_policy_->Allows(std::string_view(origin.data(), origin.size()))) {
    observability_->Log(LogContext{LogLevel::kInfo, "connection.origin_rejected", std::nullopt, std::nullopt,
                                   std::string(origin)});
    return SendError(boost::beast::http::status::unauthorized, "unauthorized", "허용되지 않은 Origin입니다");
  }

  auto identity = ParsePeerIdentity(std::string_view(req_.target().data(), req_.target().size()));
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  boost::beast::get_lowest_layer(ws).expires_never();
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "townsquare-relay");
  }));
  try {
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), identity, relay_, config_.ws_queue_limit_messages,
                                       config_.ws_queue_limit_bytes)
        ->Run();
  } catch (const boost::beast::system_error& ex) {
    observability_->Log(LogContext{LogLevel::kWarn, "connection.handshake_failed", identity.channel_id,
                                   identity.player_id, ex.what()});
  }
}

}  // namespace relay
