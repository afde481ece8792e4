/*
 * 설명: 구조화 로그 출력과 메트릭 카운터 스냅샷을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 */
#include "chatrelay/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "chatrelay/envelope.hpp"

namespace chatrelay {
namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::Increment(Metric metric, std::uint64_t by) {
  counters_[static_cast<std::size_t>(metric)].fetch_add(by, std::memory_order_relaxed);
}

std::uint64_t Observability::Value(Metric metric) const {
  return counters_[static_cast<std::size_t>(metric)].load(std::memory_order_relaxed);
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.http_requests = Value(Metric::kHttpRequests);
  snapshot.http_errors = Value(Metric::kHttpErrors);
  snapshot.connections_opened = Value(Metric::kConnectionsOpened);
  snapshot.connections_closed = Value(Metric::kConnectionsClosed);
  snapshot.auth_failures = Value(Metric::kAuthFailures);
  snapshot.deliveries = Value(Metric::kDeliveries);
  snapshot.delivery_failures = Value(Metric::kDeliveryFailures);
  snapshot.messages_sent = Value(Metric::kMessagesSent);
  snapshot.persist_failures = Value(Metric::kPersistFailures);
  snapshot.bridge_published = Value(Metric::kBridgePublished);
  snapshot.bridge_received = Value(Metric::kBridgeReceived);
  snapshot.bridge_errors = Value(Metric::kBridgeErrors);
  snapshot.idle_reaped = Value(Metric::kIdleReaped);
  return snapshot;
}

nlohmann::json Observability::SnapshotJson() const {
  auto s = Snapshot();
  return {{"requests", {{"total", s.http_requests}, {"errors", s.http_errors}}},
          {"connections", {{"opened", s.connections_opened}, {"closed", s.connections_closed}}},
          {"auth", {{"failures", s.auth_failures}}},
          {"delivery", {{"total", s.deliveries}, {"failures", s.delivery_failures}}},
          {"messages", {{"sent", s.messages_sent}, {"persistFailures", s.persist_failures}}},
          {"bridge", {{"published", s.bridge_published}, {"received", s.bridge_received}, {"errors", s.bridge_errors}}},
          {"reaper", {{"closed", s.idle_reaped}}}};
}

void Observability::Log(LogLevel level, std::string_view event, const nlohmann::json& fields) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json::object();
  log_json["ts"] = ToIsoString(std::chrono::system_clock::now());
  log_json["level"] = LevelName(level);
  log_json["event"] = event;
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << line << std::endl;
}

}  // namespace chatrelay
