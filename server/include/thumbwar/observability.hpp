/*
 * 설명: 구조화 로그(JSON 한 줄)와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace thumbwar {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view text);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  LogLevel level{LogLevel::kInfo};
  std::optional<std::uint64_t> connection_id;
  std::optional<std::string> room_code;
  std::string name;
  std::optional<std::string> detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t active_rooms{0};
  std::uint64_t running_rooms{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  MetricsSnapshot Snapshot(std::uint64_t active_rooms, std::uint64_t running_rooms) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }
  nlohmann::json Format(const LogContext& ctx) const;
  void Log(const LogContext& ctx) const;
  // 이벤트 이름만 있는 로그를 위한 축약형
  void Event(LogLevel level, std::string name, std::optional<std::uint64_t> connection_id = std::nullopt,
             std::optional<std::string> room_code = std::nullopt,
             std::optional<std::string> detail = std::nullopt);

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace thumbwar
