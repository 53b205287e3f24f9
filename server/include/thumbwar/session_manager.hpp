/*
 * 설명: 룸 입장/퇴장, 입력 반영, 룸별 고정 틱 루프 시작/정지와 이벤트 전파를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/room_session_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>

#include <nlohmann/json.hpp>

#include "thumbwar/broadcast.hpp"
#include "thumbwar/input_handler.hpp"
#include "thumbwar/observability.hpp"
#include "thumbwar/room.hpp"
#include "thumbwar/room_registry.hpp"

namespace thumbwar {

inline constexpr const char* kDefaultAvatar = "thumb1.png";
inline constexpr const char* kInvalidRoomCode = "invalid_room_id";
inline constexpr const char* kRoomFullCode = "room_full";

struct JoinAck {
  std::string room_code;
  Role role;
  ArenaConfig config;
};

nlohmann::json ToJoinPayload(const JoinAck& ack);

class SessionManager : public std::enable_shared_from_this<SessionManager> {
 public:
  SessionManager(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<EventSink> sink,
                 std::shared_ptr<Observability> observability);

  std::optional<JoinAck> Join(ConnectionId connection_id, const std::string& raw_code, const std::string& avatar,
                              std::string& error_code, std::string& error_message);
  bool Leave(ConnectionId connection_id);
  bool SubmitInput(ConnectionId connection_id, const InputState& input);

  std::optional<std::string> RoomOf(ConnectionId connection_id) const;
  std::size_t ActiveRoomCount() const { return registry_->Size(); }
  std::size_t RunningRoomCount() const;

 private:
  std::shared_ptr<RoomContext> LookupRoom(ConnectionId connection_id) const;
  void StartLoop(const std::shared_ptr<RoomContext>& ctx);
  void StopLoop(const std::shared_ptr<RoomContext>& ctx);
  void ScheduleTick(const std::shared_ptr<RoomContext>& ctx, std::uint64_t generation);
  void HandleTick(const std::shared_ptr<RoomContext>& ctx, std::uint64_t generation);

  std::shared_ptr<RoomRegistry> registry_;
  BroadcastEngine broadcaster_;
  std::shared_ptr<Observability> observability_;
  std::unordered_map<ConnectionId, std::string> connection_rooms_;
  mutable std::mutex mutex_;
};

}  // namespace thumbwar
