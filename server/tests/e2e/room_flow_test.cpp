#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "thumbwar/app.hpp"

namespace {

void ExpectWsEventEnvelope(const nlohmann::json& msg, const std::string& event_name) {
  ASSERT_TRUE(msg.is_object());
  EXPECT_EQ(msg["t"], "event");
  ASSERT_TRUE(msg.contains("seq"));
  EXPECT_TRUE(msg["seq"].is_number_unsigned());
  EXPECT_EQ(msg["event"], event_name);
  ASSERT_TRUE(msg.contains("p"));
  EXPECT_TRUE(msg["p"].is_object());
}

class RoomFlowFixture : public ::testing::Test {
 protected:
  using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  void SetUp() override {
    thumbwar::AppConfig config;
    config.port = 0;
    config.log_level = thumbwar::LogLevel::kError;
    config.worker_threads = 2;
    config.ws_queue_limit_messages = 1024;
    config.ws_queue_limit_bytes = 4 * 1024 * 1024;
    app_ = std::make_unique<thumbwar::ServerApp>(config);
    app_->Start();
    port_ = app_->Port();
    ASSERT_NE(port_, 0);
  }

  void TearDown() override { app_->Stop(); }

  std::unique_ptr<WebSocket> ConnectWs() {
    auto ws = std::make_unique<WebSocket>(ioc_);
    boost::asio::ip::tcp::resolver resolver{ioc_};
    auto const results = resolver.resolve(host_, std::to_string(port_));
    ws->next_layer().connect(results);
    ws->handshake(host_, "/ws");
    return ws;
  }

  void SendEvent(WebSocket& ws, const std::string& event, const nlohmann::json& payload, std::uint64_t seq) {
    nlohmann::json msg{{"t", "event"}, {"seq", seq}, {"event", event}, {"p", payload}};
    ws.text(true);
    ws.write(boost::asio::buffer(msg.dump()));
  }

  nlohmann::json ReadWs(WebSocket& ws, boost::beast::flat_buffer& buffer) {
    buffer.consume(buffer.size());
    ws.read(buffer);
    return nlohmann::json::parse(boost::beast::buffers_to_string(buffer.cdata()));
  }

  nlohmann::json ReadUntil(WebSocket& ws, boost::beast::flat_buffer& buffer,
                           const std::function<bool(const nlohmann::json&)>& pred, int max_messages = 400) {
    for (int i = 0; i < max_messages; ++i) {
      auto msg = ReadWs(ws, buffer);
      if (pred(msg)) {
        return msg;
      }
    }
    ADD_FAILURE() << "expected message did not arrive";
    return nullptr;
  }

  static std::function<bool(const nlohmann::json&)> IsEvent(const std::string& event) {
    return [event](const nlohmann::json& msg) { return msg.contains("event") && msg["event"] == event; };
  }

  static std::function<bool(const nlohmann::json&)> IsLobbyCount(int count) {
    return [count](const nlohmann::json& msg) {
      return msg.contains("event") && msg["event"] == "room.lobby" && msg["p"]["playerCount"] == count;
    };
  }

  nlohmann::json Join(WebSocket& ws, boost::beast::flat_buffer& buffer, const std::string& code,
                      std::uint64_t seq) {
    SendEvent(ws, "room.join", {{"code", code}, {"avatar", "thumb3.png"}}, seq);
    auto reply = ReadUntil(ws, buffer, IsEvent("room.joined"));
    EXPECT_EQ(reply["seq"], seq);
    return reply;
  }

  std::unique_ptr<thumbwar::ServerApp> app_;
  std::string host_{"127.0.0.1"};
  unsigned short port_{0};
  boost::asio::io_context ioc_;
};

}  // namespace

TEST_F(RoomFlowFixture, HealthEndpointAnswers) {
  boost::asio::ip::tcp::resolver resolver{ioc_};
  boost::beast::tcp_stream stream{ioc_};
  stream.connect(resolver.resolve(host_, std::to_string(port_)));

  boost::beast::http::request<boost::beast::http::string_body> req{boost::beast::http::verb::get, "/api/health",
                                                                    11};
  req.set(boost::beast::http::field::host, host_);
  req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  boost::beast::http::write(stream, req);

  boost::beast::flat_buffer buffer;
  boost::beast::http::response<boost::beast::http::string_body> res;
  boost::beast::http::read(stream, buffer, res);
  EXPECT_EQ(res.result(), boost::beast::http::status::ok);
  auto body = nlohmann::json::parse(res.body());
  EXPECT_TRUE(body["success"].get<bool>());
  EXPECT_EQ(body["data"]["status"], "ok");
}

TEST_F(RoomFlowFixture, TwoPlayersJoinAndReceiveState) {
  auto ws_a = ConnectWs();
  auto ws_b = ConnectWs();
  boost::beast::flat_buffer buf_a;
  boost::beast::flat_buffer buf_b;

  auto joined_a = Join(*ws_a, buf_a, " e2e ", 1);
  ExpectWsEventEnvelope(joined_a, "room.joined");
  EXPECT_TRUE(joined_a["p"]["ok"].get<bool>());
  EXPECT_EQ(joined_a["p"]["role"], "P1");
  EXPECT_EQ(joined_a["p"]["config"]["width"], 800.0);
  EXPECT_EQ(joined_a["p"]["config"]["height"], 500.0);
  ReadUntil(*ws_a, buf_a, IsLobbyCount(1));

  auto joined_b = Join(*ws_b, buf_b, "E2E", 5);
  EXPECT_EQ(joined_b["p"]["role"], "P2");
  ReadUntil(*ws_b, buf_b, IsLobbyCount(2));
  ReadUntil(*ws_a, buf_a, IsLobbyCount(2));

  SendEvent(*ws_a, "input", {{"right", true}, {"acting", true}}, 2);
  auto state = ReadUntil(*ws_a, buf_a, [](const nlohmann::json& msg) {
    return msg.contains("event") && msg["event"] == "room.state" && msg["p"]["players"][0]["dominant"] == true;
  });
  ExpectWsEventEnvelope(state, "room.state");
  ASSERT_EQ(state["p"]["players"].size(), 2u);
  EXPECT_TRUE(state["p"]["winner"].is_null());
  const auto& p1 = state["p"]["players"][0];
  EXPECT_EQ(p1["role"], "P1");
  EXPECT_EQ(p1["avatar"], "thumb3.png");
  EXPECT_TRUE(p1["acting"].get<bool>());
  EXPECT_GT(p1["x"].get<double>(), 160.0);

  ws_a->close(boost::beast::websocket::close_code::normal);
  ws_b->close(boost::beast::websocket::close_code::normal);
}

TEST_F(RoomFlowFixture, JoinRejectionsAreReportedInReply) {
  auto ws = ConnectWs();
  boost::beast::flat_buffer buf;

  auto empty = Join(*ws, buf, "   ", 1);
  EXPECT_FALSE(empty["p"]["ok"].get<bool>());
  EXPECT_EQ(empty["p"]["code"], "invalid_room_id");
  EXPECT_EQ(empty["p"]["error"], "invalid room id");

  auto too_long = Join(*ws, buf, "ABCDEFGHIJKLM", 2);
  EXPECT_FALSE(too_long["p"]["ok"].get<bool>());
  EXPECT_EQ(too_long["p"]["code"], "invalid_room_id");
  EXPECT_EQ(app_->GetSessionManager()->ActiveRoomCount(), 0u);

  auto ws_1 = ConnectWs();
  auto ws_2 = ConnectWs();
  auto ws_3 = ConnectWs();
  boost::beast::flat_buffer b1;
  boost::beast::flat_buffer b2;
  boost::beast::flat_buffer b3;
  EXPECT_EQ(Join(*ws_1, b1, "FULL", 1)["p"]["role"], "P1");
  EXPECT_EQ(Join(*ws_2, b2, "FULL", 1)["p"]["role"], "P2");
  EXPECT_EQ(Join(*ws_3, b3, "FULL", 1)["p"]["role"], "P3");

  auto full = Join(*ws, buf, "full", 3);
  EXPECT_FALSE(full["p"]["ok"].get<bool>());
  EXPECT_EQ(full["p"]["code"], "room_full");
  EXPECT_EQ(full["p"]["error"], "room is full");
}

TEST_F(RoomFlowFixture, DisconnectUpdatesLobbyAndStopsLoop) {
  auto ws_a = ConnectWs();
  auto ws_b = ConnectWs();
  boost::beast::flat_buffer buf_a;
  boost::beast::flat_buffer buf_b;
  Join(*ws_a, buf_a, "BYE", 1);
  Join(*ws_b, buf_b, "BYE", 1);
  ReadUntil(*ws_a, buf_a, IsEvent("room.state"));
  EXPECT_EQ(app_->GetSessionManager()->RunningRoomCount(), 1u);

  ws_b->close(boost::beast::websocket::close_code::normal);
  auto lobby = ReadUntil(*ws_a, buf_a, IsLobbyCount(1));
  ExpectWsEventEnvelope(lobby, "room.lobby");
  EXPECT_EQ(app_->GetSessionManager()->RunningRoomCount(), 0u);

  ws_a->close(boost::beast::websocket::close_code::normal);
}

TEST_F(RoomFlowFixture, MalformedMessagesGetBadRequest) {
  auto ws = ConnectWs();
  boost::beast::flat_buffer buf;
  ws->text(true);
  ws->write(boost::asio::buffer(std::string("not json")));
  auto error = ReadWs(*ws, buf);
  EXPECT_EQ(error["t"], "error");
  EXPECT_EQ(error["p"]["code"], "bad_request");

  SendEvent(*ws, "dance", nlohmann::json::object(), 9);
  auto unknown = ReadWs(*ws, buf);
  EXPECT_EQ(unknown["t"], "error");
  EXPECT_EQ(unknown["seq"], 9);

  SendEvent(*ws, "input", {{"up", true}}, 10);
  auto joined = Join(*ws, buf, "QUIET", 11);
  EXPECT_TRUE(joined["p"]["ok"].get<bool>());
}
