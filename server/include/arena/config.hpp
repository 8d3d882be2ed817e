/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace arena {

struct AppConfig {
  unsigned short port;
  std::string log_level;
  std::string auth_token_secret;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  int game_tick_rate;
  int game_win_score;
  int game_countdown_seconds;
  std::size_t game_reconnect_grace_seconds;
  std::uint32_t game_random_seed;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  unsigned int worker_threads;
};

// 값이 범위를 벗어나면 std::invalid_argument 를 던진다.
AppConfig LoadConfigFromEnv();
void ValidateConfig(const AppConfig& config);

}  // namespace arena
