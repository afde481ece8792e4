/*
 * 설명: 구조화 로그(JSON 한 줄)와 실시간 전달 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatrelay {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);

enum class Metric : std::size_t {
  kHttpRequests = 0,
  kHttpErrors,
  kConnectionsOpened,
  kConnectionsClosed,
  kAuthFailures,
  kDeliveries,
  kDeliveryFailures,
  kMessagesSent,
  kPersistFailures,
  kBridgePublished,
  kBridgeReceived,
  kBridgeErrors,
  kIdleReaped,
  kCount
};

struct MetricsSnapshot {
  std::uint64_t http_requests{0};
  std::uint64_t http_errors{0};
  std::uint64_t connections_opened{0};
  std::uint64_t connections_closed{0};
  std::uint64_t auth_failures{0};
  std::uint64_t deliveries{0};
  std::uint64_t delivery_failures{0};
  std::uint64_t messages_sent{0};
  std::uint64_t persist_failures{0};
  std::uint64_t bridge_published{0};
  std::uint64_t bridge_received{0};
  std::uint64_t bridge_errors{0};
  std::uint64_t idle_reaped{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();

  void Increment(Metric metric, std::uint64_t by = 1);
  std::uint64_t Value(Metric metric) const;
  MetricsSnapshot Snapshot() const;
  nlohmann::json SnapshotJson() const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(LogLevel level, std::string_view event, const nlohmann::json& fields = nlohmann::json::object()) const;
  void Debug(std::string_view event, const nlohmann::json& fields = nlohmann::json::object()) const {
    Log(LogLevel::kDebug, event, fields);
  }
  void Info(std::string_view event, const nlohmann::json& fields = nlohmann::json::object()) const {
    Log(LogLevel::kInfo, event, fields);
  }
  void Warn(std::string_view event, const nlohmann::json& fields = nlohmann::json::object()) const {
    Log(LogLevel::kWarn, event, fields);
  }
  void Error(std::string_view event, const nlohmann::json& fields = nlohmann::json::object()) const {
    Log(LogLevel::kError, event, fields);
  }

 private:
  LogLevel min_level_;
  std::array<std::atomic<std::uint64_t>, static_cast<std::size_t>(Metric::kCount)> counters_{};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace chatrelay
