/*
 * 설명: WebSocket 메시지를 읽어 룸 입장/입력을 처리하고 서버 이벤트를 순서대로 송신한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#include "thumbwar/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

namespace thumbwar {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<RealtimeCoordinator> coordinator,
                                   std::shared_ptr<SessionManager> session_manager,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), coordinator_(std::move(coordinator)), session_manager_(std::move(session_manager)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { coordinator_->Unregister(connection_id_, this); }

void WebSocketSession::Run() {
  connection_id_ = coordinator_->Register(shared_from_this());
  observability_->Event(LogLevel::kInfo, "ws.open", connection_id_);
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    LeaveRoomOnce();
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec || closing_) {
    // 연결 종료는 어떤 원인이든 룸 퇴장으로 이어진다.
    LeaveRoomOnce();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  try {
    auto message = nlohmann::json::parse(data);
    std::uint64_t seq = 0;
    auto seq_it = message.find("seq");
    if (seq_it != message.end() && seq_it->is_number_unsigned()) {
      seq = seq_it->get<std::uint64_t>();
    }
    auto type_it = message.find("t");
    auto event_it = message.find("event");
    auto payload_it = message.find("p");
    if (type_it == message.end() || *type_it != "event" || event_it == message.end() || !event_it->is_string()) {
      SendError("bad_request", "unknown message type", seq);
    } else if (payload_it == message.end() || !payload_it->is_object()) {
      SendError("bad_request", "payload is required", seq);
    } else if (*event_it == "room.join") {
      HandleJoin(*payload_it, seq);
    } else if (*event_it == "input") {
      HandleInput(*payload_it);
    } else {
      SendError("bad_request", "unknown event", seq);
    }
  } catch (const nlohmann::json::exception&) {
    SendError("bad_request", "malformed json", 0);
  }

  DoRead();
}

void WebSocketSession::HandleJoin(const nlohmann::json& payload, std::uint64_t seq) {
  std::string code;
  auto code_it = payload.find("code");
  if (code_it != payload.end() && code_it->is_string()) {
    code = code_it->get<std::string>();
  }
  std::string avatar;
  auto avatar_it = payload.find("avatar");
  if (avatar_it != payload.end() && avatar_it->is_string()) {
    avatar = avatar_it->get<std::string>();
  }

  std::string error_code;
  std::string error_message;
  auto ack = session_manager_->Join(connection_id_, code, avatar, error_code, error_message);
  if (!ack) {
    SendEvent("room.joined", {{"ok", false}, {"code", error_code}, {"error", error_message}}, seq);
    return;
  }
  SendEvent("room.joined", ToJoinPayload(*ack), seq);
}

void WebSocketSession::HandleInput(const nlohmann::json& payload) {
  // 미등록 연결이나 종료된 룸의 입력은 조용히 버린다.
  if (!session_manager_->SubmitInput(connection_id_, ParseInputState(payload))) {
    observability_->Event(LogLevel::kDebug, "input.dropped", connection_id_);
  }
}

void WebSocketSession::SendEvent(const std::string& event, const nlohmann::json& payload, std::uint64_t seq) {
  WsEnvelope env{.type = "event", .event = event, .seq = seq, .payload = payload};
  EnqueueMessage(std::make_shared<const std::string>(ToWsJson(env).dump()));
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  WsEnvelope env{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
  EnqueueMessage(std::make_shared<const std::string>(ToWsJson(env).dump()));
}

void WebSocketSession::SendFrame(std::shared_ptr<const std::string> frame) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
    self->EnqueueMessage(std::move(frame));
  });
}

void WebSocketSession::EnqueueMessage(std::shared_ptr<const std::string> message) {
  if (closing_) {
    return;
  }
  const auto message_size = message->size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(*send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front()->size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    LeaveRoomOnce();
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  observability_->Event(LogLevel::kWarn, "ws.backpressure_close", connection_id_);
  LeaveRoomOnce();
  if (writing_) {
    // 진행 중인 쓰기 버퍼는 OnWrite가 정리한다. close 프레임 대신 소켓을 끊는다.
    boost::beast::error_code ignored;
    ws_.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    return;
  }
  send_queue_.clear();
  queued_bytes_ = 0;
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::LeaveRoomOnce() {
  if (left_) {
    return;
  }
  left_ = true;
  session_manager_->Leave(connection_id_);
  observability_->Event(LogLevel::kInfo, "ws.close", connection_id_);
}

}  // namespace thumbwar
