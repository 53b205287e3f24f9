/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 */
#include "thumbwar/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace thumbwar {

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "info") {
    return LogLevel::kInfo;
  }
  if (text == "warn") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

std::string_view LogLevelName(LogLevel level) {
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

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_rooms, std::uint64_t running_rooms) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.active_rooms = active_rooms;
  snapshot.running_rooms = running_rooms;
  return snapshot;
}

nlohmann::json Observability::Format(const LogContext& ctx) const {
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (ctx.room_code) {
    log_json["roomCode"] = *ctx.room_code;
  }
  if (ctx.detail) {
    log_json["detail"] = *ctx.detail;
  }
  return log_json;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  auto line = Format(ctx).dump();
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << line << std::endl;
}

void Observability::Event(LogLevel level, std::string name, std::optional<std::uint64_t> connection_id,
                          std::optional<std::string> room_code, std::optional<std::string> detail) {
  if (!Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = NextTraceId();
  ctx.level = level;
  ctx.connection_id = connection_id;
  ctx.room_code = std::move(room_code);
  ctx.name = std::move(name);
  ctx.detail = std::move(detail);
  Log(ctx);
}

}  // namespace thumbwar
