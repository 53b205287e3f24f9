/*
 * 설명: 룸 단위 고정 스텝을 수행한다. 호출자는 룸 락을 잡은 상태여야 한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/simulation_test.cpp
 */
#include "thumbwar/simulation.hpp"

#include <algorithm>
#include <cmath>

namespace thumbwar {
namespace {
double ClampAxis(double value, double radius, double extent) {
  return std::max(radius, std::min(extent - radius, value));
}

double Accumulate(double timer, double dt, double limit) { return std::min(limit, timer + dt); }

double Decay(double timer, double dt) { return std::max(0.0, timer - dt * kPinDecayFactor); }

bool IsPinning(const Player& player) { return player.dominant && player.acting; }
}  // namespace

void IntegrateMotion(Room& room) {
  const auto& cfg = room.config;
  for (auto& p : room.players) {
    p.x = ClampAxis(p.x + p.vx, cfg.radius, cfg.width);
    p.y = ClampAxis(p.y + p.vy, cfg.radius, cfg.height);
  }
}

void ResolvePins(Room& room, double dt) {
  const double contact = room.config.radius * kContactRadiusFactor;
  const double limit = room.config.win_pin_seconds;
  auto& players = room.players;
  for (std::size_t i = 0; i < players.size(); ++i) {
    for (std::size_t j = i + 1; j < players.size(); ++j) {
      Player& a = players[i];
      Player& b = players[j];
      double dist = std::hypot(a.x - b.x, a.y - b.y);
      if (dist < contact) {
        a.pin_timer = IsPinning(a) ? Accumulate(a.pin_timer, dt, limit) : Decay(a.pin_timer, dt);
        b.pin_timer = IsPinning(b) ? Accumulate(b.pin_timer, dt, limit) : Decay(b.pin_timer, dt);
      } else {
        a.pin_timer = Decay(a.pin_timer, dt);
        b.pin_timer = Decay(b.pin_timer, dt);
      }
    }
  }
}

std::optional<Role> DetectWinner(const Room& room) {
  for (const auto& p : room.players) {
    if (p.pin_timer >= room.config.win_pin_seconds) {
      return p.role;
    }
  }
  return std::nullopt;
}

StepOutcome StepRoom(Room& room) {
  StepOutcome outcome;
  IntegrateMotion(room);
  ResolvePins(room, room.config.StepSeconds());
  if (!room.winner) {
    auto winner = DetectWinner(room);
    if (winner) {
      room.winner = winner;
      outcome.winner_recorded = true;
    }
  }
  outcome.winner = room.winner;
  return outcome;
}

void ResetRound(Room& room) {
  room.winner.reset();
  for (auto& p : room.players) {
    auto spawn = SpawnPosition(p.role, room.config);
    p.x = spawn.x;
    p.y = spawn.y;
    p.vx = 0.0;
    p.vy = 0.0;
    p.acting = false;
    p.dominant = false;
    p.pin_timer = 0.0;
  }
}

nlohmann::json BuildStateSnapshot(const Room& room) {
  nlohmann::json players_json = nlohmann::json::array();
  for (const auto& p : room.players) {
    players_json.push_back({{"role", RoleName(p.role)},
                            {"x", p.x},
                            {"y", p.y},
                            {"acting", p.acting},
                            {"dominanceTimer", p.pin_timer},
                            {"avatar", p.avatar},
                            {"dominant", p.dominant}});
  }
  nlohmann::json winner = nullptr;
  if (room.winner) {
    winner = RoleName(*room.winner);
  }
  return {{"players", players_json}, {"winner", winner}};
}

}  // namespace thumbwar
