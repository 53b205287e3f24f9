/*
 * 설명: WebSocket 연결의 메시지 처리(입장/입력), 송신 큐 백프레셔, 종료 시 퇴장 처리를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "thumbwar/api_response.hpp"
#include "thumbwar/observability.hpp"
#include "thumbwar/realtime.hpp"
#include "thumbwar/session_manager.hpp"

namespace thumbwar {

class WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<RealtimeCoordinator> coordinator,
                   std::shared_ptr<SessionManager> session_manager, std::shared_ptr<Observability> observability,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession();
  void Run();

  // 어느 스레드에서든 호출 가능하다. 실제 큐 조작은 연결의 strand에서 수행된다.
  void SendFrame(std::shared_ptr<const std::string> frame);
  ConnectionId Id() const { return connection_id_; }

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleJoin(const nlohmann::json& payload, std::uint64_t seq);
  void HandleInput(const nlohmann::json& payload);
  void SendEvent(const std::string& event, const nlohmann::json& payload, std::uint64_t seq);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void EnqueueMessage(std::shared_ptr<const std::string> message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void LeaveRoomOnce();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<Observability> observability_;
  ConnectionId connection_id_{0};
  std::deque<std::shared_ptr<const std::string>> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool left_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace thumbwar
