/*
 * 설명: 룸과 플레이어 상태, 좌석(역할) 배정 규칙을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/room_registry_test.cpp, server/tests/unit/simulation_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace thumbwar {

using ConnectionId = std::uint64_t;

enum class Role { kP1, kP2, kP3 };

inline constexpr Role kAllRoles[] = {Role::kP1, Role::kP2, Role::kP3};
inline constexpr std::size_t kMaxPlayersPerRoom = 3;
inline constexpr std::size_t kMaxRoomCodeLength = 12;

std::string_view RoleName(Role role);

struct ArenaConfig {
  double width{800.0};
  double height{500.0};
  double radius{30.0};
  double win_pin_seconds{2.0};
  double move_speed{3.2};
  int tick_rate_hz{60};

  double StepSeconds() const { return 1.0 / static_cast<double>(tick_rate_hz); }
};

struct Player {
  ConnectionId connection_id{0};
  Role role{Role::kP1};
  double x{0.0};
  double y{0.0};
  // 입력 처리기가 스텝 단위로 미리 스케일한 속도
  double vx{0.0};
  double vy{0.0};
  bool acting{false};
  double pin_timer{0.0};
  std::string avatar;
  bool dominant{false};
};

struct Vec2 {
  double x;
  double y;
};

// players는 입장 순서를 유지한다. 승자 판정 동점 처리와 스냅샷 순서가 이 순서를 따른다.
struct Room {
  std::string code;
  ArenaConfig config;
  std::vector<Player> players;
  std::optional<Role> winner;

  Player* FindPlayer(ConnectionId connection_id);
  const Player* FindPlayer(ConnectionId connection_id) const;
  bool RemovePlayer(ConnectionId connection_id);
  std::size_t PlayerCount() const { return players.size(); }
};

std::optional<Role> AssignRole(const Room& room);
Vec2 SpawnPosition(Role role, const ArenaConfig& config);

}  // namespace thumbwar
