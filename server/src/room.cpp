/*
 * 설명: 좌석 배정과 스폰 위치 계산, 플레이어 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/room_registry_test.cpp
 */
#include "thumbwar/room.hpp"

#include <algorithm>

namespace thumbwar {

std::string_view RoleName(Role role) {
  switch (role) {
    case Role::kP1:
      return "P1";
    case Role::kP2:
      return "P2";
    case Role::kP3:
      return "P3";
  }
  return "P1";
}

Player* Room::FindPlayer(ConnectionId connection_id) {
  auto it = std::find_if(players.begin(), players.end(),
                         [connection_id](const Player& p) { return p.connection_id == connection_id; });
  return it == players.end() ? nullptr : &*it;
}

const Player* Room::FindPlayer(ConnectionId connection_id) const {
  auto it = std::find_if(players.begin(), players.end(),
                         [connection_id](const Player& p) { return p.connection_id == connection_id; });
  return it == players.end() ? nullptr : &*it;
}

bool Room::RemovePlayer(ConnectionId connection_id) {
  auto it = std::find_if(players.begin(), players.end(),
                         [connection_id](const Player& p) { return p.connection_id == connection_id; });
  if (it == players.end()) {
    return false;
  }
  players.erase(it);
  return true;
}

std::optional<Role> AssignRole(const Room& room) {
  for (Role role : kAllRoles) {
    bool taken = std::any_of(room.players.begin(), room.players.end(),
                             [role](const Player& p) { return p.role == role; });
    if (!taken) {
      return role;
    }
  }
  return std::nullopt;
}

Vec2 SpawnPosition(Role role, const ArenaConfig& config) {
  double fraction = 0.2;
  if (role == Role::kP2) {
    fraction = 0.5;
  } else if (role == Role::kP3) {
    fraction = 0.8;
  }
  Vec2 spawn{config.width * fraction, config.height * 0.5};
  // 작은 아레나에서도 스폰 지점이 경계 안에 있도록 한다.
  spawn.x = std::clamp(spawn.x, config.radius, std::max(config.radius, config.width - config.radius));
  spawn.y = std::clamp(spawn.y, config.radius, std::max(config.radius, config.height - config.radius));
  return spawn;
}

}  // namespace thumbwar
