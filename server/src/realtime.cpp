/*
 * 설명: 연결 등록/해제와 이벤트 팬아웃을 처리한다. 프레임은 한 번만 직렬화해 공유한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#include "thumbwar/realtime.hpp"

#include "thumbwar/api_response.hpp"
#include "thumbwar/websocket_session.hpp"

namespace thumbwar {

ConnectionId RealtimeCoordinator::Register(const std::shared_ptr<WebSocketSession>& session) {
  ConnectionId id = next_connection_id_.fetch_add(1);
  std::lock_guard<std::mutex> lock(mutex_);
  connections_[id] = Entry{session, session.get()};
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
  return id;
}

void RealtimeCoordinator::Unregister(ConnectionId connection_id, const WebSocketSession* session) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return;
  }
  if (it->second.raw == session) {
    connections_.erase(it);
    if (observability_) {
      observability_->SetWebsocketActive(connections_.size());
    }
  }
}

void RealtimeCoordinator::Deliver(const std::vector<ConnectionId>& targets, const std::string& event,
                                  const nlohmann::json& payload) {
  std::vector<std::shared_ptr<WebSocketSession>> sessions;
  sessions.reserve(targets.size());
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (ConnectionId id : targets) {
      auto it = connections_.find(id);
      if (it == connections_.end()) {
        continue;
      }
      if (auto session = it->second.session.lock()) {
        sessions.push_back(std::move(session));
      }
    }
  }
  if (sessions.empty()) {
    return;
  }
  WsEnvelope env{.type = "event", .event = event, .seq = 0, .payload = payload};
  auto frame = std::make_shared<const std::string>(ToWsJson(env).dump());
  for (const auto& session : sessions) {
    session->SendFrame(frame);
  }
}

std::size_t RealtimeCoordinator::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

}  // namespace thumbwar
