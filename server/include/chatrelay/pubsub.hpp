/*
 * 설명: 프로세스 간 팬아웃 백본 추상화. Redis pub/sub 구현과 프로세스 내 허브 구현을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/fanout_bridge_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "chatrelay/observability.hpp"

namespace sw::redis {
class Redis;
}

namespace chatrelay {

using PubSubHandler = std::function<void(const std::string& channel, const std::string& payload)>;

class PubSubTransport {
 public:
  virtual ~PubSubTransport() = default;

  // 실패 시 예외를 던진다. 호출자가 잡아서 기록한다.
  virtual void Publish(const std::string& channel, const std::string& payload) = 0;
  // pattern은 끝의 '*' 하나만 와일드카드로 해석한다.
  virtual void Start(const std::string& pattern, PubSubHandler handler) = 0;
  virtual void Stop() = 0;
};

bool MatchesPattern(const std::string& pattern, const std::string& channel);

class InProcessPubSubTransport;

// 여러 서버 인스턴스가 한 프로세스 안에서 같은 백본을 공유하도록 한다.
class InProcessPubSubHub : public std::enable_shared_from_this<InProcessPubSubHub> {
 public:
  std::shared_ptr<InProcessPubSubTransport> CreateTransport();
  void Broadcast(const std::string& channel, const std::string& payload);

 private:
  friend class InProcessPubSubTransport;
  void Detach(const InProcessPubSubTransport* transport);

  std::mutex mutex_;
  std::vector<std::weak_ptr<InProcessPubSubTransport>> transports_;
};

class InProcessPubSubTransport : public PubSubTransport,
                                 public std::enable_shared_from_this<InProcessPubSubTransport> {
 public:
  explicit InProcessPubSubTransport(std::weak_ptr<InProcessPubSubHub> hub) : hub_(std::move(hub)) {}
  ~InProcessPubSubTransport() override;

  void Publish(const std::string& channel, const std::string& payload) override;
  void Start(const std::string& pattern, PubSubHandler handler) override;
  void Stop() override;

  // 허브가 호출한다. 시작되지 않았거나 패턴이 맞지 않으면 무시한다.
  void Deliver(const std::string& channel, const std::string& payload);

 private:
  std::weak_ptr<InProcessPubSubHub> hub_;
  std::mutex mutex_;
  std::string pattern_;
  PubSubHandler handler_;
};

struct RedisSettings {
  std::string host;
  unsigned short port;
  std::string password;
  std::chrono::milliseconds socket_timeout{std::chrono::milliseconds(500)};
  std::chrono::milliseconds max_backoff{std::chrono::milliseconds(5000)};
};

class RedisPubSubTransport : public PubSubTransport {
 public:
  RedisPubSubTransport(const RedisSettings& settings, std::shared_ptr<Observability> observability);
  ~RedisPubSubTransport() override;

  void Publish(const std::string& channel, const std::string& payload) override;
  void Start(const std::string& pattern, PubSubHandler handler) override;
  void Stop() override;

 private:
  void ConsumeLoop(std::string pattern, PubSubHandler handler);
  void SleepBackoff(std::size_t attempt);

  RedisSettings settings_;
  std::shared_ptr<Observability> observability_;
  std::unique_ptr<sw::redis::Redis> redis_;
  std::thread subscriber_thread_;
  std::atomic<bool> running_{false};
};

}  // namespace chatrelay
