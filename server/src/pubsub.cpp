/*
 * 설명: 프로세스 내 허브와 redis++ 기반 pub/sub 전송을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/fanout_bridge_test.cpp
 */
#include "chatrelay/pubsub.hpp"

#include <algorithm>
#include <stdexcept>

#include <sw/redis++/redis++.h>

namespace chatrelay {

bool MatchesPattern(const std::string& pattern, const std::string& channel) {
  if (!pattern.empty() && pattern.back() == '*') {
    return channel.compare(0, pattern.size() - 1, pattern, 0, pattern.size() - 1) == 0;
  }
  return pattern == channel;
}

std::shared_ptr<InProcessPubSubTransport> InProcessPubSubHub::CreateTransport() {
  auto transport = std::make_shared<InProcessPubSubTransport>(weak_from_this());
  std::lock_guard<std::mutex> lock(mutex_);
  transports_.push_back(transport);
  return transport;
}

void InProcessPubSubHub::Broadcast(const std::string& channel, const std::string& payload) {
  std::vector<std::shared_ptr<InProcessPubSubTransport>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& weak : transports_) {
      if (auto transport = weak.lock()) {
        targets.push_back(std::move(transport));
      }
    }
  }
  for (const auto& transport : targets) {
    transport->Deliver(channel, payload);
  }
}

void InProcessPubSubHub::Detach(const InProcessPubSubTransport* transport) {
  std::lock_guard<std::mutex> lock(mutex_);
  transports_.erase(std::remove_if(transports_.begin(), transports_.end(),
                                   [transport](const std::weak_ptr<InProcessPubSubTransport>& weak) {
                                     auto locked = weak.lock();
                                     return !locked || locked.get() == transport;
                                   }),
                    transports_.end());
}

InProcessPubSubTransport::~InProcessPubSubTransport() {
  if (auto hub = hub_.lock()) {
    hub->Detach(this);
  }
}

void InProcessPubSubTransport::Publish(const std::string& channel, const std::string& payload) {
  auto hub = hub_.lock();
  if (!hub) {
    throw std::runtime_error("pub/sub 허브가 종료되었습니다");
  }
  hub->Broadcast(channel, payload);
}

void InProcessPubSubTransport::Start(const std::string& pattern, PubSubHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  pattern_ = pattern;
  handler_ = std::move(handler);
}

void InProcessPubSubTransport::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = nullptr;
}

void InProcessPubSubTransport::Deliver(const std::string& channel, const std::string& payload) {
  PubSubHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handler_ || !MatchesPattern(pattern_, channel)) {
      return;
    }
    handler = handler_;
  }
  handler(channel, payload);
}

RedisPubSubTransport::RedisPubSubTransport(const RedisSettings& settings, std::shared_ptr<Observability> observability)
    : settings_(settings), observability_(std::move(observability)) {
  sw::redis::ConnectionOptions options;
  options.host = settings_.host;
  options.port = settings_.port;
  if (!settings_.password.empty()) {
    options.password = settings_.password;
  }
  options.socket_timeout = settings_.socket_timeout;
  sw::redis::ConnectionPoolOptions pool_options;
  pool_options.size = 4;
  redis_ = std::make_unique<sw::redis::Redis>(options, pool_options);
}

RedisPubSubTransport::~RedisPubSubTransport() { Stop(); }

void RedisPubSubTransport::Publish(const std::string& channel, const std::string& payload) {
  redis_->publish(channel, payload);
}

void RedisPubSubTransport::Start(const std::string& pattern, PubSubHandler handler) {
  if (running_.exchange(true)) {
    return;
  }
  subscriber_thread_ = std::thread([this, pattern, handler = std::move(handler)]() { ConsumeLoop(pattern, handler); });
}

void RedisPubSubTransport::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  // consume()은 socket_timeout마다 깨어나 running_을 확인한다.
  if (subscriber_thread_.joinable()) {
    subscriber_thread_.join();
  }
}

void RedisPubSubTransport::ConsumeLoop(std::string pattern, PubSubHandler handler) {
  std::size_t attempt = 0;
  while (running_) {
    try {
      auto subscriber = redis_->subscriber();
      subscriber.on_pmessage([this, &handler](std::string, std::string channel, std::string payload) {
        // 핸들러 예외가 consume()을 지나 구독 스레드를 끝내지 않게 한다.
        try {
          handler(channel, payload);
        } catch (const std::exception& ex) {
          if (observability_) {
            observability_->Increment(Metric::kBridgeErrors);
            observability_->Warn("redis_message_handler_failed", {{"channel", channel}, {"reason", ex.what()}});
          }
        }
      });
      subscriber.psubscribe(pattern);
      if (observability_) {
        observability_->Info("redis_subscribed", {{"pattern", pattern}, {"attempt", attempt}});
      }
      attempt = 0;
      while (running_) {
        try {
          subscriber.consume();
        } catch (const sw::redis::TimeoutError&) {
          continue;
        }
      }
    } catch (const sw::redis::Error& ex) {
      if (!running_) {
        break;
      }
      ++attempt;
      if (observability_) {
        observability_->Increment(Metric::kBridgeErrors);
        observability_->Warn("redis_subscriber_error", {{"reason", ex.what()}, {"attempt", attempt}});
      }
      SleepBackoff(attempt);
    }
  }
}

void RedisPubSubTransport::SleepBackoff(std::size_t attempt) {
  auto shift = std::min<std::size_t>(attempt, 6);
  auto delay = std::min(settings_.max_backoff, std::chrono::milliseconds(100 * (1 << shift)));
  auto deadline = std::chrono::steady_clock::now() + delay;
  while (running_ && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

}  // namespace chatrelay
