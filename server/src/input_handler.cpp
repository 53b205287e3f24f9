/*
 * 설명: 입력 플래그를 정규화된 스텝 속도로 바꾸고 지배 플래그를 즉시 갱신한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/simulation_test.cpp
 */
#include "thumbwar/input_handler.hpp"

#include <cmath>

namespace thumbwar {
namespace {
bool ReadFlag(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  return it != payload.end() && it->is_boolean() && it->get<bool>();
}
}  // namespace

InputState ParseInputState(const nlohmann::json& payload) {
  InputState input;
  if (!payload.is_object()) {
    return input;
  }
  input.up = ReadFlag(payload, "up");
  input.down = ReadFlag(payload, "down");
  input.left = ReadFlag(payload, "left");
  input.right = ReadFlag(payload, "right");
  input.acting = ReadFlag(payload, "acting");
  return input;
}

bool ApplyInput(Room& room, ConnectionId connection_id, const InputState& input) {
  if (room.winner) {
    return false;
  }
  Player* me = room.FindPlayer(connection_id);
  if (me == nullptr) {
    return false;
  }

  double dx = (input.right ? 1.0 : 0.0) - (input.left ? 1.0 : 0.0);
  double dy = (input.down ? 1.0 : 0.0) - (input.up ? 1.0 : 0.0);
  double magnitude = std::hypot(dx, dy);
  if (magnitude == 0.0) {
    magnitude = 1.0;
  }
  me->vx = dx / magnitude * room.config.move_speed;
  me->vy = dy / magnitude * room.config.move_speed;
  me->acting = input.acting;

  if (me->acting) {
    for (auto& other : room.players) {
      other.dominant = false;
    }
    me->dominant = true;
  } else {
    me->dominant = false;
  }
  return true;
}

}  // namespace thumbwar
