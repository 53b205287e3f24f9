/*
 * 설명: 룸 이벤트 페이로드를 직렬화해 현재 멤버에게 fire-and-forget으로 전달한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/room_session_test.cpp
 */
#include "thumbwar/broadcast.hpp"

#include "thumbwar/simulation.hpp"

namespace thumbwar {

BroadcastEngine::BroadcastEngine(std::shared_ptr<EventSink> sink) : sink_(std::move(sink)) {}

void BroadcastEngine::Lobby(const Room& room) {
  if (room.players.empty()) {
    return;
  }
  sink_->Deliver(Members(room), kLobbyEvent, {{"playerCount", room.PlayerCount()}});
}

void BroadcastEngine::State(const Room& room) { sink_->Deliver(Members(room), kStateEvent, BuildStateSnapshot(room)); }

void BroadcastEngine::End(const Room& room, Role winner) {
  sink_->Deliver(Members(room), kEndEvent, {{"winner", RoleName(winner)}});
}

std::vector<ConnectionId> BroadcastEngine::Members(const Room& room) {
  std::vector<ConnectionId> ids;
  ids.reserve(room.players.size());
  for (const auto& p : room.players) {
    ids.push_back(p.connection_id);
  }
  return ids;
}

}  // namespace thumbwar
