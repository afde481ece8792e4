/*
 * 설명: 운영 HTTP 요청 처리와 WebSocket 업그레이드 후 세션 생성을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#include "chatrelay/http_session.hpp"

#include <optional>
#include <unordered_map>

#include <boost/beast/version.hpp>

#include "chatrelay/envelope.hpp"
#include "chatrelay/websocket_session.hpp"

namespace chatrelay {

namespace {
constexpr const char* kServerName = "chatrelay";
constexpr const char* kPresencePrefix = "/api/presence/";

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, RealtimeServices services,
                         std::shared_ptr<PresenceTracker> presence)
    : stream_(std::move(socket)), config_(config), services_(std::move(services)), presence_(std::move(presence)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
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
  namespace http = boost::beast::http;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = services_.observability->NextTraceId();
  services_.observability->Increment(Metric::kHttpRequests);

  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target = std::string(req_.target());
  std::string path = target.substr(0, target.find('?'));

  auto respond = [&](http::status status, const nlohmann::json& body) {
    res->result(status);
    res->body() = body.dump();
    res->content_length(res->body().size());
    SendResponse(res);
  };

  if (req_.method() != http::verb::get) {
    return respond(http::status::method_not_allowed,
                   MakeErrorEnvelope("method_not_allowed", "GET 요청만 지원합니다"));
  }
  if (path == "/api/health") {
    return respond(http::status::ok,
                   MakeSuccessEnvelope({{"status", "ok"}, {"serverId", config_.server_id}, {"version", "v1.2.0"}}));
  }
  if (path == "/metrics") {
    return respond(http::status::ok, MakeSuccessEnvelope(services_.observability->SnapshotJson()));
  }
  if (path == "/api/stats") {
    return respond(http::status::ok, MakeSuccessEnvelope(BuildStats()));
  }
  if (path.compare(0, std::char_traits<char>::length(kPresencePrefix), kPresencePrefix) == 0) {
    auto user_id = path.substr(std::char_traits<char>::length(kPresencePrefix));
    if (user_id.empty()) {
      return respond(http::status::bad_request, MakeErrorEnvelope("bad_request", "user_id가 필요합니다"));
    }
    auto record = presence_->Get(user_id);
    nlohmann::json payload{{"user_id", user_id},
                           {"status", record.online ? "online" : "offline"},
                           {"last_seen", record.last_seen ? nlohmann::json(ToIsoString(*record.last_seen))
                                                          : nlohmann::json(nullptr)}};
    return respond(http::status::ok, MakeSuccessEnvelope(payload));
  }
  respond(http::status::not_found, MakeErrorEnvelope("not_found", "존재하지 않는 경로입니다"));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  auto status = res->result_int();
  if (status >= 400) {
    services_.observability->Increment(Metric::kHttpErrors);
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  services_.observability->Info(
      "http_request",
      {{"traceId", trace_id_}, {"path", std::string(req_.target().substr(0, req_.target().find('?')))},
       {"status", status}, {"latencyMs", latency}});
  boost::beast::http::async_write(stream_, *res,
                                  [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                                    if (ec) {
                                      return;
                                    }
                                    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
                                  });
}

void HttpSession::HandleWebSocket() {
  std::string target = std::string(req_.target());
  auto qpos = target.find('?');
  std::string path = target.substr(0, qpos);
  if (path != "/ws") {
    request_start_ = std::chrono::steady_clock::now();
    auto res = std::make_shared<Response>();
    res->version(req_.version());
    res->result(boost::beast::http::status::not_found);
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res->body() = MakeErrorEnvelope("not_found", "WebSocket 엔드포인트는 /ws 입니다").dump();
    res->content_length(res->body().size());
    return SendResponse(res);
  }
  // 토큰 검증 실패도 업그레이드 후 4401 종료 코드로 알린다.
  auto token = ExtractToken(qpos == std::string::npos ? std::string{} : target.substr(qpos + 1));

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  boost::beast::get_lowest_layer(ws).expires_never();
  auto timeout = boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server);
  // 유휴 종료는 IdleReaper가 4001로 처리한다.
  timeout.idle_timeout = boost::beast::websocket::stream_base::none();
  ws.set_option(timeout);
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  try {
    ws.accept(req_);
    SessionLimits limits{config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes,
                         std::chrono::seconds(config_.ws_write_timeout_seconds)};
    std::make_shared<WebSocketSession>(std::move(ws), services_, limits)->Run(token);
  } catch (const std::exception& ex) {
    services_.observability->Warn("ws_upgrade_failed", {{"reason", ex.what()}});
    boost::beast::error_code ec;
    boost::beast::get_lowest_layer(ws).socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }
}

std::string HttpSession::ExtractToken(const std::string& query) const {
  auto params = ParseQueryParams(query);
  auto it = params.find("token");
  if (it != params.end() && !it->second.empty()) {
    return it->second;
  }
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  if (auth_it == req_.end()) {
    return {};
  }
  return ParseBearer(std::string(auth_it->value()));
}

std::string HttpSession::ParseBearer(const std::string& header_value) const {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

nlohmann::json HttpSession::BuildStats() const {
  return {{"server_id", config_.server_id},
          {"total_connections", services_.registry->TotalConnections()},
          {"online_users", services_.registry->OnlineUsers().size()},
          {"active_chatrooms", services_.subscriptions->RoomCount()},
          {"total_subscriptions", services_.subscriptions->SubscriptionCount()},
          {"user_presence_tracked", presence_->TrackedCount()}};
}

}  // namespace chatrelay
