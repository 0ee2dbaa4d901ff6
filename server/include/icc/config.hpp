/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace icc {

enum class BackendKind { kRedis, kMemory };
enum class AuthMode { kFake, kTicket };
enum class SettingsMode { kStatic, kMariaDb };

inline constexpr char kDevelopmentTokenKey[] = "icc-development-key";

struct AppConfig {
  unsigned short port{9007};
  BackendKind backend{BackendKind::kRedis};
  std::string redis_host{"localhost"};
  unsigned short redis_port{6379};
  std::size_t applause_interval_seconds{5};
  std::size_t applause_retention_seconds{300};
  std::size_t applause_tick_ms{1000};
  std::size_t prune_tick_seconds{60};
  std::size_t applause_refresh_ticks{60};
  AuthMode auth{AuthMode::kFake};
  std::string auth_token_key;
  bool development{false};
  SettingsMode settings{SettingsMode::kStatic};
  std::string db_host{"localhost"};
  unsigned short db_port{3306};
  std::string db_user{"icc"};
  std::string db_password;
  std::string db_name{"icc"};
  std::string log_level{"info"};
};

// 잘못된 숫자나 알 수 없는 모드는 std::invalid_argument.
AppConfig LoadConfigFromEnv();

}  // namespace icc
