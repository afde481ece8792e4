/*
 * 설명: 주기적으로 연결의 마지막 활동 시각을 검사해 유휴 연결을 4001로 종료한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/idle_reaper_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "chatrelay/connection_registry.hpp"
#include "chatrelay/observability.hpp"

namespace chatrelay {

class IdleReaper : public std::enable_shared_from_this<IdleReaper> {
 public:
  IdleReaper(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
             std::shared_ptr<Observability> observability, std::chrono::seconds idle_timeout,
             std::chrono::seconds interval);

  void Start();
  void Stop();
  // now 기준으로 idle_timeout을 넘긴 연결을 닫고 닫은 개수를 반환한다.
  std::size_t Sweep(std::chrono::steady_clock::time_point now);

 private:
  void Arm();
  void OnTick(const boost::system::error_code& ec);

  boost::asio::steady_timer timer_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::chrono::seconds idle_timeout_;
  std::chrono::seconds interval_;
  std::mutex mutex_;
  bool running_{false};
};

}  // namespace chatrelay
