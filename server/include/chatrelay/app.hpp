/*
 * 설명: 실시간 서버 전체 수명주기(구성 요소 조립, 리스너, 워커, 브리지, 유휴 정리)를 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "chatrelay/config.hpp"
#include "chatrelay/db_client.hpp"
#include "chatrelay/idle_reaper.hpp"
#include "chatrelay/observability.hpp"
#include "chatrelay/presence_tracker.hpp"
#include "chatrelay/protocol_handler.hpp"
#include "chatrelay/pubsub.hpp"

namespace chatrelay {

class Listener;

class ServerApp {
 public:
  // transport를 넘기면 FANOUT_MODE와 관계없이 그 백본으로 팬아웃한다.
  explicit ServerApp(const AppConfig& config, std::shared_ptr<PubSubTransport> transport = nullptr);
  ~ServerApp();

  // 현재 스레드에서 io_context를 돌리며 종료될 때까지 반환하지 않는다.
  void Run();
  // 멱등. 다른 스레드에서 호출해 Run을 끝낸다.
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  const RealtimeServices& GetServices() const { return services_; }
  std::shared_ptr<PresenceTracker> GetPresence() { return presence_; }
  std::shared_ptr<IdleReaper> GetIdleReaper() { return reaper_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();
  // 워커 스레드 안에서도 안전한 종료 요청. 스레드를 join하지 않는다.
  void Halt();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<PubSubTransport> transport_;
  RealtimeServices services_;
  std::shared_ptr<PresenceTracker> presence_;
  std::shared_ptr<IdleReaper> reaper_;
  std::vector<std::thread> workers_;
  std::mutex workers_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<bool> halted_{false};
};

}  // namespace chatrelay
