/*
 * 설명: 플레이어 방향/액션 입력을 속도와 지배(dominant) 플래그로 반영한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/simulation_test.cpp
 */
#pragma once

#include <nlohmann/json.hpp>

#include "thumbwar/room.hpp"

namespace thumbwar {

struct InputState {
  bool up{false};
  bool down{false};
  bool left{false};
  bool right{false};
  bool acting{false};
};

InputState ParseInputState(const nlohmann::json& payload);

// 승자가 기록된 룸이거나 룸 멤버가 아니면 false를 반환하고 아무것도 바꾸지 않는다.
bool ApplyInput(Room& room, ConnectionId connection_id, const InputState& input);

}  // namespace thumbwar
