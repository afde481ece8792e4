/*
 * 설명: WebSocket 연결의 읽기/쓰기, 송신 큐 백프레셔, 쓰기 타임아웃과 종료 경로를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "chatrelay/connection.hpp"
#include "chatrelay/protocol_handler.hpp"

namespace chatrelay {

struct SessionLimits {
  std::size_t max_queue_messages;
  std::size_t max_queue_bytes;
  std::chrono::seconds write_timeout;
};

class WebSocketSession : public Connection, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, RealtimeServices services,
                   const SessionLimits& limits);
  ~WebSocketSession() override;

  // 업그레이드가 끝난 뒤 strand 위에서 호출한다.
  void Run(const std::string& token);

  ConnectionId Id() const override { return id_; }
  const ChatUser& User() const override { return handler_.User(); }
  bool Send(std::shared_ptr<const std::string> frame) override;
  void Close(std::uint16_t code, const std::string& reason) override;
  std::chrono::system_clock::time_point CreatedAt() const override { return created_at_; }
  std::chrono::steady_clock::time_point LastActivity() const override { return last_activity_.load(); }

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void Enqueue(std::shared_ptr<const std::string> frame);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void OnWriteTimeout(boost::beast::error_code ec);
  void DoClose(std::uint16_t code, const std::string& reason);
  void MarkClosed();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  boost::asio::steady_timer write_timer_;
  ConnectionId id_;
  std::chrono::system_clock::time_point created_at_;
  std::atomic<std::chrono::steady_clock::time_point> last_activity_;
  std::shared_ptr<Observability> observability_;
  ProtocolHandler handler_;
  std::deque<std::shared_ptr<const std::string>> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  std::atomic<bool> closing_{false};
  SessionLimits limits_;
};

}  // namespace chatrelay
