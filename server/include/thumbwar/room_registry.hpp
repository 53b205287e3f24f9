/*
 * 설명: 룸 코드별 룸 컨텍스트(상태, 락, 틱 타이머)를 생성/조회/제거한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/room_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "thumbwar/room.hpp"

namespace thumbwar {

struct RoomContext {
  RoomContext(boost::asio::io_context& ioc, std::string code, const ArenaConfig& config)
      : strand(boost::asio::make_strand(ioc)), timer(strand) {
    room.code = std::move(code);
    room.config = config;
  }

  // room, timer, running, loop_generation, destroyed 모두 이 뮤텍스로 보호한다.
  std::mutex mutex;
  Room room;
  boost::asio::strand<boost::asio::io_context::executor_type> strand;
  boost::asio::steady_timer timer;
  std::chrono::steady_clock::time_point next_tick{};
  std::uint64_t loop_generation{0};
  bool running{false};
  bool destroyed{false};
};

class RoomRegistry {
 public:
  RoomRegistry(boost::asio::io_context& ioc, const ArenaConfig& defaults);

  static std::string NormalizeCode(std::string_view raw);
  static bool IsValidCode(const std::string& normalized);

  std::shared_ptr<RoomContext> GetOrCreate(const std::string& code, bool& created);
  std::shared_ptr<RoomContext> Find(const std::string& code) const;
  bool Remove(const std::string& code, const RoomContext* expected);
  std::size_t Size() const;
  std::vector<std::shared_ptr<RoomContext>> List() const;
  const ArenaConfig& Defaults() const { return defaults_; }

 private:
  boost::asio::io_context& ioc_;
  ArenaConfig defaults_;
  std::unordered_map<std::string, std::shared_ptr<RoomContext>> rooms_;
  mutable std::mutex mutex_;
};

}  // namespace thumbwar
