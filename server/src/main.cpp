/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다. SIGINT/SIGTERM은 ServerApp이 처리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/realtime_flow_test.cpp
 */
#include <exception>
#include <iostream>

#include "chatrelay/app.hpp"

int main() {
  using namespace chatrelay;
  try {
    AppConfig config = LoadConfigFromEnv();
    ServerApp app(config);
    app.Run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 시작 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
