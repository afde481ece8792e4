/*
 * 설명: 유휴 연결 주기 점검 타이머와 종료 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/idle_reaper_test.cpp
 */
#include "chatrelay/idle_reaper.hpp"

namespace chatrelay {

IdleReaper::IdleReaper(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
                       std::shared_ptr<Observability> observability, std::chrono::seconds idle_timeout,
                       std::chrono::seconds interval)
    : timer_(ioc),
      registry_(std::move(registry)),
      observability_(std::move(observability)),
      idle_timeout_(idle_timeout),
      interval_(interval) {}

void IdleReaper::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  Arm();
}

void IdleReaper::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
  timer_.cancel();
}

std::size_t IdleReaper::Sweep(std::chrono::steady_clock::time_point now) {
  std::size_t reaped = 0;
  for (const auto& connection : registry_->Snapshot()) {
    auto idle = now - connection->LastActivity();
    if (idle <= idle_timeout_) {
      continue;
    }
    observability_->Info("connection_idle_reaped",
                         {{"connectionId", connection->Id()},
                          {"userId", connection->User().user_id},
                          {"idleSeconds", std::chrono::duration_cast<std::chrono::seconds>(idle).count()}});
    connection->Close(kCloseIdleTimeout, "idle_timeout");
    registry_->Remove(connection->Id());
    ++reaped;
  }
  if (reaped > 0) {
    observability_->Increment(Metric::kIdleReaped, reaped);
  }
  return reaped;
}

void IdleReaper::Arm() {
  timer_.expires_after(interval_);
  auto self = shared_from_this();
  timer_.async_wait([self](const boost::system::error_code& ec) { self->OnTick(ec); });
}

void IdleReaper::OnTick(const boost::system::error_code& ec) {
  if (ec == boost::asio::error::operation_aborted) {
    return;
  }
  Sweep(std::chrono::steady_clock::now());
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    Arm();
  }
}

}  // namespace chatrelay
