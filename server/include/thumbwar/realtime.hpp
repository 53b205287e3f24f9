/*
 * 설명: WebSocket 연결에 ConnectionId를 부여하고 서버 이벤트를 연결별로 전달한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "thumbwar/observability.hpp"
#include "thumbwar/room.hpp"

namespace thumbwar {

class WebSocketSession;

// 룸 세션 관리자가 이벤트를 내보내는 경계. 전달은 best-effort이며 실패를 보고하지 않는다.
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void Deliver(const std::vector<ConnectionId>& targets, const std::string& event,
                       const nlohmann::json& payload) = 0;
};

class RealtimeCoordinator : public EventSink {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  ConnectionId Register(const std::shared_ptr<WebSocketSession>& session);
  void Unregister(ConnectionId connection_id, const WebSocketSession* session);
  void Deliver(const std::vector<ConnectionId>& targets, const std::string& event,
               const nlohmann::json& payload) override;
  std::size_t ActiveConnections() const;

 private:
  struct Entry {
    std::weak_ptr<WebSocketSession> session;
    const WebSocketSession* raw{nullptr};
  };

  std::atomic<ConnectionId> next_connection_id_{1};
  std::unordered_map<ConnectionId, Entry> connections_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace thumbwar
