/*
 * 설명: 룸 멤버십 상태 머신(Idle/Running/Ended)과 룸별 틱 루프를 조율한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/room_session_test.cpp, server/tests/e2e/room_flow_test.cpp
 */
#include "thumbwar/session_manager.hpp"

#include <boost/asio/bind_executor.hpp>

#include "thumbwar/simulation.hpp"

namespace thumbwar {

nlohmann::json ToJoinPayload(const JoinAck& ack) {
  return {{"ok", true},
          {"room", ack.room_code},
          {"role", RoleName(ack.role)},
          {"config",
           {{"width", ack.config.width},
            {"height", ack.config.height},
            {"radius", ack.config.radius},
            {"winPinSeconds", ack.config.win_pin_seconds}}}};
}

SessionManager::SessionManager(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<EventSink> sink,
                               std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), broadcaster_(std::move(sink)), observability_(std::move(observability)) {}

std::optional<JoinAck> SessionManager::Join(ConnectionId connection_id, const std::string& raw_code,
                                            const std::string& avatar, std::string& error_code,
                                            std::string& error_message) {
  std::string code = RoomRegistry::NormalizeCode(raw_code);
  if (!RoomRegistry::IsValidCode(code)) {
    error_code = kInvalidRoomCode;
    error_message = "invalid room id";
    observability_->Event(LogLevel::kInfo, "room.join_rejected", connection_id, code, error_code);
    return std::nullopt;
  }

  // 같은 연결의 재입장은 기존 룸을 먼저 떠난다.
  if (RoomOf(connection_id)) {
    Leave(connection_id);
  }

  while (true) {
    bool created = false;
    auto ctx = registry_->GetOrCreate(code, created);
    if (created) {
      observability_->Event(LogLevel::kInfo, "room.created", connection_id, code);
    }

    std::lock_guard<std::mutex> room_lock(ctx->mutex);
    if (ctx->destroyed) {
      // 마지막 멤버 퇴장과 경합한 경우 새 룸으로 다시 시도한다.
      continue;
    }
    Room& room = ctx->room;
    auto role = AssignRole(room);
    if (!role) {
      error_code = kRoomFullCode;
      error_message = "room is full";
      observability_->Event(LogLevel::kInfo, "room.join_rejected", connection_id, code, error_code);
      return std::nullopt;
    }

    Player player;
    player.connection_id = connection_id;
    player.role = *role;
    auto spawn = SpawnPosition(*role, room.config);
    player.x = spawn.x;
    player.y = spawn.y;
    player.avatar = avatar.empty() ? std::string{kDefaultAvatar} : avatar;
    room.players.push_back(std::move(player));
    {
      std::lock_guard<std::mutex> lock(mutex_);
      connection_rooms_[connection_id] = code;
    }
    observability_->Event(LogLevel::kInfo, "room.joined", connection_id, code, std::string(RoleName(*role)));

    broadcaster_.Lobby(room);
    if (room.PlayerCount() == 2 && !ctx->running && !room.winner) {
      StartLoop(ctx);
    }
    return JoinAck{code, *role, room.config};
  }
}

bool SessionManager::Leave(ConnectionId connection_id) {
  std::string code;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connection_rooms_.find(connection_id);
    if (it == connection_rooms_.end()) {
      return false;
    }
    code = it->second;
    connection_rooms_.erase(it);
  }
  auto ctx = registry_->Find(code);
  if (!ctx) {
    return false;
  }

  std::lock_guard<std::mutex> room_lock(ctx->mutex);
  Room& room = ctx->room;
  if (!room.RemovePlayer(connection_id)) {
    return false;
  }
  observability_->Event(LogLevel::kInfo, "room.left", connection_id, code);

  broadcaster_.Lobby(room);
  if (room.PlayerCount() < 2) {
    StopLoop(ctx);
    ResetRound(room);
  }
  if (room.PlayerCount() == 0) {
    ctx->destroyed = true;
    registry_->Remove(code, ctx.get());
    observability_->Event(LogLevel::kInfo, "room.destroyed", std::nullopt, code);
  }
  return true;
}

bool SessionManager::SubmitInput(ConnectionId connection_id, const InputState& input) {
  auto ctx = LookupRoom(connection_id);
  if (!ctx) {
    return false;
  }
  std::lock_guard<std::mutex> room_lock(ctx->mutex);
  return ApplyInput(ctx->room, connection_id, input);
}

std::optional<std::string> SessionManager::RoomOf(ConnectionId connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connection_rooms_.find(connection_id);
  if (it == connection_rooms_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t SessionManager::RunningRoomCount() const {
  std::size_t count = 0;
  for (const auto& ctx : registry_->List()) {
    std::lock_guard<std::mutex> room_lock(ctx->mutex);
    if (ctx->running) {
      ++count;
    }
  }
  return count;
}

std::shared_ptr<RoomContext> SessionManager::LookupRoom(ConnectionId connection_id) const {
  auto code = RoomOf(connection_id);
  if (!code) {
    return nullptr;
  }
  return registry_->Find(*code);
}

// 아래 함수들은 모두 ctx->mutex를 잡은 상태에서 호출된다.
void SessionManager::StartLoop(const std::shared_ptr<RoomContext>& ctx) {
  if (ctx->running) {
    return;
  }
  ctx->running = true;
  std::uint64_t generation = ++ctx->loop_generation;
  ctx->next_tick = std::chrono::steady_clock::now();
  observability_->Event(LogLevel::kInfo, "room.loop_started", std::nullopt, ctx->room.code);
  ScheduleTick(ctx, generation);
}

void SessionManager::StopLoop(const std::shared_ptr<RoomContext>& ctx) {
  if (!ctx->running) {
    return;
  }
  ctx->running = false;
  ++ctx->loop_generation;
  ctx->timer.cancel();
  observability_->Event(LogLevel::kInfo, "room.loop_stopped", std::nullopt, ctx->room.code);
}

void SessionManager::ScheduleTick(const std::shared_ptr<RoomContext>& ctx, std::uint64_t generation) {
  auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(ctx->room.config.StepSeconds()));
  ctx->next_tick += interval;
  ctx->timer.expires_at(ctx->next_tick);
  auto self = shared_from_this();
  ctx->timer.async_wait(boost::asio::bind_executor(
      ctx->strand, [self, ctx, generation](const boost::system::error_code& ec) {
        if (!ec) {
          self->HandleTick(ctx, generation);
        }
      }));
}

void SessionManager::HandleTick(const std::shared_ptr<RoomContext>& ctx, std::uint64_t generation) {
  std::lock_guard<std::mutex> room_lock(ctx->mutex);
  if (!ctx->running || ctx->loop_generation != generation) {
    return;
  }
  Room& room = ctx->room;
  if (room.PlayerCount() < 2 || room.winner) {
    ctx->running = false;
    return;
  }

  auto outcome = StepRoom(room);
  broadcaster_.State(room);
  if (outcome.winner_recorded) {
    broadcaster_.End(room, *outcome.winner);
    ctx->running = false;
    observability_->Event(LogLevel::kInfo, "room.winner", std::nullopt, room.code,
                          std::string(RoleName(*outcome.winner)));
    return;
  }
  ScheduleTick(ctx, generation);
}

}  // namespace thumbwar
