/*
 * 설명: 실시간 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace chatrelay {

struct AppConfig {
  unsigned short port;
  std::string server_id;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string redis_host;
  unsigned short redis_port;
  std::string redis_password;
  std::string redis_channel_prefix;
  // redis | local
  std::string fanout_mode;
  // mariadb | open
  std::string directory_mode;
  // mariadb | log
  std::string persistence_mode;
  std::string log_level;
  std::string jwt_secret;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t ws_write_timeout_seconds;
  std::size_t ws_idle_timeout_seconds;
  std::size_t ws_reap_interval_seconds;
  std::size_t ws_max_connections_per_user;
  std::size_t persist_workers;
  std::size_t worker_threads;
};

AppConfig LoadConfigFromEnv();

}  // namespace chatrelay
