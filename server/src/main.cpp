/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <iostream>
#include <stdexcept>

#include "icc/app.hpp"

int main() {
  using namespace icc;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::invalid_argument& ex) {
    std::cerr << "환경설정 오류: " << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);
  app.Run();
  return 0;
}
