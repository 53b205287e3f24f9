/*
 * 설명: 고정 스텝 시뮬레이션(이동 적분, 쌍별 핀 타이머, 승자 판정)을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/simulation_test.cpp
 */
#pragma once

#include <optional>

#include <nlohmann/json.hpp>

#include "thumbwar/room.hpp"

namespace thumbwar {

inline constexpr double kContactRadiusFactor = 1.4;
inline constexpr double kPinDecayFactor = 0.5;

struct StepOutcome {
  bool winner_recorded{false};
  std::optional<Role> winner;
};

void IntegrateMotion(Room& room);

// 쌍마다 독립적으로 적용한다. 3인 룸에서는 한 플레이어가 스텝당 여러 번 갱신될 수 있다.
void ResolvePins(Room& room, double dt);

std::optional<Role> DetectWinner(const Room& room);

StepOutcome StepRoom(Room& room);

// 이전 게임의 흔적(승자, 핀 타이머, 입력, 위치)을 지우고 각 좌석의 스폰 위치로 되돌린다.
void ResetRound(Room& room);

nlohmann::json BuildStateSnapshot(const Room& room);

}  // namespace thumbwar
