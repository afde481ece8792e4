/*
 * 설명: HTTP 연결을 처리하고 운영 엔드포인트(health/metrics/stats/presence)와 /ws 업그레이드를 분기한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "chatrelay/config.hpp"
#include "chatrelay/observability.hpp"
#include "chatrelay/presence_tracker.hpp"
#include "chatrelay/protocol_handler.hpp"

namespace chatrelay {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, RealtimeServices services,
              std::shared_ptr<PresenceTracker> presence);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();
  std::string ExtractToken(const std::string& query) const;
  std::string ParseBearer(const std::string& header_value) const;
  nlohmann::json BuildStats() const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  RealtimeServices services_;
  std::shared_ptr<PresenceTracker> presence_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace chatrelay
