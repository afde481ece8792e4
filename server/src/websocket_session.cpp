/*
 * 설명: WebSocket 프레임 수신을 프로토콜 핸들러로 넘기고, strand 위에서 송신 큐를 비운다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#include "chatrelay/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace chatrelay {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   RealtimeServices services, const SessionLimits& limits)
    : ws_(std::move(ws)),
      write_timer_(ws_.get_executor()),
      id_(NextConnectionId()),
      created_at_(std::chrono::system_clock::now()),
      last_activity_(std::chrono::steady_clock::now()),
      observability_(services.observability),
      handler_(*this, std::move(services)),
      limits_(limits) {}

WebSocketSession::~WebSocketSession() { handler_.HandleClosed(); }

void WebSocketSession::Run(const std::string& token) {
  ws_.read_message_max(64 * 1024);
  if (!handler_.Open(token, shared_from_this())) {
    return;
  }
  DoRead();
}

bool WebSocketSession::Send(std::shared_ptr<const std::string> frame) {
  if (closing_) {
    return false;
  }
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
    self->Enqueue(std::move(frame));
  });
  return true;
}

void WebSocketSession::Close(std::uint16_t code, const std::string& reason) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), code, reason]() { self->DoClose(code, reason); });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    if (ec != boost::beast::websocket::error::closed && !closing_) {
      observability_->Debug("ws_read_failed", {{"connectionId", id_}, {"reason", ec.message()}});
    }
    MarkClosed();
    return;
  }
  last_activity_ = std::chrono::steady_clock::now();
  auto text = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  handler_.HandleFrame(text);
  DoRead();
}

void WebSocketSession::Enqueue(std::shared_ptr<const std::string> frame) {
  if (closing_) {
    return;
  }
  const auto frame_size = frame->size();
  if (send_queue_.size() >= limits_.max_queue_messages || queued_bytes_ + frame_size > limits_.max_queue_bytes) {
    observability_->Warn("ws_backpressure_exceeded",
                         {{"connectionId", id_}, {"queued", send_queue_.size()}, {"queuedBytes", queued_bytes_}});
    DoClose(kClosePolicy, "backpressure_exceeded");
    return;
  }
  send_queue_.push_back(std::move(frame));
  queued_bytes_ += frame_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  write_timer_.expires_after(limits_.write_timeout);
  write_timer_.async_wait([self](boost::beast::error_code ec) { self->OnWriteTimeout(ec); });
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(*send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  write_timer_.cancel();
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front()->size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    observability_->Debug("ws_write_failed", {{"connectionId", id_}, {"reason", ec.message()}});
    MarkClosed();
    return;
  }
  WriteNext();
}

void WebSocketSession::OnWriteTimeout(boost::beast::error_code ec) {
  if (ec == boost::asio::error::operation_aborted || !writing_) {
    return;
  }
  observability_->Warn("ws_write_timeout", {{"connectionId", id_}});
  MarkClosed();
  boost::beast::error_code ignored;
  boost::beast::get_lowest_layer(ws_).socket().close(ignored);
}

void WebSocketSession::DoClose(std::uint16_t code, const std::string& reason) {
  if (closing_.exchange(true)) {
    return;
  }
  handler_.HandleClosed();
  // 진행 중인 쓰기의 버퍼는 완료될 때까지 남겨 둔다.
  auto keep = writing_ && !send_queue_.empty() ? 1 : 0;
  send_queue_.erase(send_queue_.begin() + keep, send_queue_.end());
  queued_bytes_ = keep ? send_queue_.front()->size() : 0;
  write_timer_.cancel();
  boost::beast::websocket::close_reason close_reason{code};
  close_reason.reason = reason.c_str();
  auto self = shared_from_this();
  ws_.async_close(close_reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::MarkClosed() {
  closing_ = true;
  handler_.HandleClosed();
}

}  // namespace chatrelay
