/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

#include "thumbwar/observability.hpp"
#include "thumbwar/room.hpp"

namespace thumbwar {

struct AppConfig {
  unsigned short port{3000};
  LogLevel log_level{LogLevel::kInfo};
  ArenaConfig arena;
  std::size_t ws_queue_limit_messages{64};
  std::size_t ws_queue_limit_bytes{262144};
  unsigned int worker_threads{0};
};

// 숫자 형식이 잘못된 값은 std::invalid_argument를 던진다.
AppConfig LoadConfigFromEnv();

}  // namespace thumbwar
