/*
 * 설명: 로비/상태/종료 이벤트를 만들어 룸 멤버 전원에게 전달한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/room_session_test.cpp
 */
#pragma once

#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

#include "thumbwar/realtime.hpp"
#include "thumbwar/room.hpp"

namespace thumbwar {

inline constexpr const char* kLobbyEvent = "room.lobby";
inline constexpr const char* kStateEvent = "room.state";
inline constexpr const char* kEndEvent = "room.end";

class BroadcastEngine {
 public:
  explicit BroadcastEngine(std::shared_ptr<EventSink> sink);

  void Lobby(const Room& room);
  void State(const Room& room);
  void End(const Room& room, Role winner);

 private:
  static std::vector<ConnectionId> Members(const Room& room);

  std::shared_ptr<EventSink> sink_;
};

}  // namespace thumbwar
