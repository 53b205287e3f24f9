/*
 * 설명: HTTP 요청을 처리하고 헬스/메트릭/WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/room_flow_test.cpp
 */
#include "thumbwar/http_session.hpp"

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "thumbwar/api_response.hpp"
#include "thumbwar/websocket_session.hpp"

namespace thumbwar {

namespace {
constexpr const char* kServerName = "thumbwar-server";
constexpr const char* kServerVersion = "v1.0.0";

std::string TargetPath(boost::beast::string_view target) {
  std::string path(target);
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path.resize(qpos);
  }
  return path;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<RealtimeCoordinator> coordinator,
                         std::shared_ptr<SessionManager> session_manager,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), coordinator_(std::move(coordinator)),
      session_manager_(std::move(session_manager)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_) && TargetPath(req_.target()) == "/ws") {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path = TargetPath(req_.target());

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", kServerVersion}};
    res->result(http::status::ok);
    res->body() = MakeSuccessEnvelope(payload).dump();
    res->prepare_payload();
    return SendResponse(res);
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot =
        observability_->Snapshot(session_manager_->ActiveRoomCount(), session_manager_->RunningRoomCount());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"rooms", {{"active", snapshot.active_rooms}, {"running", snapshot.running_rooms}}}};
    res->result(http::status::ok);
    res->body() = MakeSuccessEnvelope(data).dump();
    res->prepare_payload();
    return SendResponse(res);
  }

  res->result(http::status::not_found);
  res->body() = MakeErrorEnvelope("not_found", "unsupported path").dump();
  res->prepare_payload();
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
          .count();
  LogContext ctx;
  ctx.trace_id = trace_id_;
  ctx.name = std::string(req_.target());
  ctx.latency_ms = static_cast<long>(latency);
  observability_->Log(ctx);
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    observability_->Event(LogLevel::kWarn, "ws.handshake_failed", std::nullopt, std::nullopt, ec.message());
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), coordinator_, session_manager_, observability_,
                                     config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
      ->Run();
}

}  // namespace thumbwar
