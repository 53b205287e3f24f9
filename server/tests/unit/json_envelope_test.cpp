#include <gtest/gtest.h>

#include "thumbwar/api_response.hpp"
#include "thumbwar/observability.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = thumbwar::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = thumbwar::MakeErrorEnvelope("not_found", "unsupported path");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "not_found");
  EXPECT_EQ(env["error"]["message"], "unsupported path");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, WsEventAndErrorShapes) {
  thumbwar::WsEnvelope event{.type = "event", .event = "room.lobby", .seq = 0, .payload = {{"playerCount", 2}}};
  auto j = thumbwar::ToWsJson(event);
  EXPECT_EQ(j["t"], "event");
  EXPECT_EQ(j["event"], "room.lobby");
  EXPECT_EQ(j["seq"], 0);
  EXPECT_EQ(j["p"]["playerCount"], 2);

  thumbwar::WsEnvelope error{.type = "error", .event = "", .seq = 7, .payload = {{"code", "bad_request"}}};
  auto e = thumbwar::ToWsJson(error);
  EXPECT_EQ(e["t"], "error");
  EXPECT_TRUE(e["event"].is_null());
  EXPECT_EQ(e["seq"], 7);
}

TEST(ObservabilityTest, FormatsStructuredLogLine) {
  thumbwar::Observability obs(thumbwar::LogLevel::kWarn);
  thumbwar::LogContext ctx;
  ctx.trace_id = obs.NextTraceId();
  ctx.level = thumbwar::LogLevel::kWarn;
  ctx.connection_id = 12;
  ctx.room_code = "TEST";
  ctx.name = "room.winner";
  ctx.detail = "P1";
  auto line = obs.Format(ctx);
  EXPECT_EQ(line["level"], "warn");
  EXPECT_EQ(line["eventName"], "room.winner");
  EXPECT_EQ(line["connectionId"], 12);
  EXPECT_EQ(line["roomCode"], "TEST");
  EXPECT_EQ(line["detail"], "P1");
  EXPECT_FALSE(line["traceId"].get<std::string>().empty());

  EXPECT_FALSE(obs.Enabled(thumbwar::LogLevel::kInfo));
  EXPECT_TRUE(obs.Enabled(thumbwar::LogLevel::kError));
  EXPECT_EQ(thumbwar::ParseLogLevel("debug"), thumbwar::LogLevel::kDebug);
  EXPECT_FALSE(thumbwar::ParseLogLevel("verbose").has_value());
}

TEST(ObservabilityTest, MetricsSnapshotCarriesCounters) {
  thumbwar::Observability obs;
  obs.IncrementRequest();
  obs.IncrementRequest();
  obs.IncrementError();
  obs.SetWebsocketActive(3);
  auto snapshot = obs.Snapshot(4, 1);
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.websocket_active, 3u);
  EXPECT_EQ(snapshot.active_rooms, 4u);
  EXPECT_EQ(snapshot.running_rooms, 1u);
}
