#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include "thumbwar/room.hpp"
#include "thumbwar/room_registry.hpp"

namespace {

thumbwar::Player MakePlayer(thumbwar::ConnectionId id, thumbwar::Role role) {
  thumbwar::Player p;
  p.connection_id = id;
  p.role = role;
  return p;
}

}  // namespace

TEST(RoomCodeTest, NormalizeTrimsAndUppercases) {
  EXPECT_EQ(thumbwar::RoomRegistry::NormalizeCode("  test "), "TEST");
  EXPECT_EQ(thumbwar::RoomRegistry::NormalizeCode("\tab1c\n"), "AB1C");
  EXPECT_EQ(thumbwar::RoomRegistry::NormalizeCode("   "), "");
  EXPECT_EQ(thumbwar::RoomRegistry::NormalizeCode("a b"), "A B");
}

TEST(RoomCodeTest, ValidLengthIsOneToTwelve) {
  EXPECT_FALSE(thumbwar::RoomRegistry::IsValidCode(""));
  EXPECT_TRUE(thumbwar::RoomRegistry::IsValidCode("A"));
  EXPECT_TRUE(thumbwar::RoomRegistry::IsValidCode("ABCDEFGHIJKL"));
  EXPECT_FALSE(thumbwar::RoomRegistry::IsValidCode("ABCDEFGHIJKLM"));
}

TEST(RoomRegistryTest, GetOrCreateReusesExistingRoom) {
  boost::asio::io_context ioc;
  thumbwar::ArenaConfig defaults;
  defaults.width = 640;
  thumbwar::RoomRegistry registry(ioc, defaults);

  bool created = false;
  auto first = registry.GetOrCreate("TEST", created);
  EXPECT_TRUE(created);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->room.code, "TEST");
  EXPECT_DOUBLE_EQ(first->room.config.width, 640);
  EXPECT_FALSE(first->running);
  EXPECT_FALSE(first->room.winner.has_value());

  auto second = registry.GetOrCreate("TEST", created);
  EXPECT_FALSE(created);
  EXPECT_EQ(first, second);
  EXPECT_EQ(registry.Size(), 1u);
  EXPECT_EQ(registry.Find("TEST"), first);
  EXPECT_EQ(registry.Find("OTHER"), nullptr);
}

TEST(RoomRegistryTest, RemoveOnlyMatchingContext) {
  boost::asio::io_context ioc;
  thumbwar::RoomRegistry registry(ioc, thumbwar::ArenaConfig{});
  bool created = false;
  auto ctx = registry.GetOrCreate("ROOM", created);

  thumbwar::RoomContext stranger(ioc, "ROOM", thumbwar::ArenaConfig{});
  EXPECT_FALSE(registry.Remove("ROOM", &stranger));
  EXPECT_EQ(registry.Size(), 1u);

  EXPECT_TRUE(registry.Remove("ROOM", ctx.get()));
  EXPECT_EQ(registry.Size(), 0u);
  EXPECT_FALSE(registry.Remove("ROOM", ctx.get()));

  auto fresh = registry.GetOrCreate("ROOM", created);
  EXPECT_TRUE(created);
  EXPECT_NE(fresh, ctx);
}

TEST(RoleAssignerTest, PicksLowestFreeSeat) {
  thumbwar::Room room;
  EXPECT_EQ(thumbwar::AssignRole(room), thumbwar::Role::kP1);

  room.players.push_back(MakePlayer(1, thumbwar::Role::kP1));
  room.players.push_back(MakePlayer(3, thumbwar::Role::kP3));
  EXPECT_EQ(thumbwar::AssignRole(room), thumbwar::Role::kP2);

  room.players.push_back(MakePlayer(2, thumbwar::Role::kP2));
  EXPECT_FALSE(thumbwar::AssignRole(room).has_value());

  ASSERT_TRUE(room.RemovePlayer(1));
  EXPECT_EQ(thumbwar::AssignRole(room), thumbwar::Role::kP1);
  EXPECT_FALSE(room.RemovePlayer(1));
}

TEST(RoleAssignerTest, SpawnPositionsFollowSeat) {
  thumbwar::ArenaConfig cfg;
  auto p1 = thumbwar::SpawnPosition(thumbwar::Role::kP1, cfg);
  auto p2 = thumbwar::SpawnPosition(thumbwar::Role::kP2, cfg);
  auto p3 = thumbwar::SpawnPosition(thumbwar::Role::kP3, cfg);
  EXPECT_DOUBLE_EQ(p1.x, 160);
  EXPECT_DOUBLE_EQ(p1.y, 250);
  EXPECT_DOUBLE_EQ(p2.x, 400);
  EXPECT_DOUBLE_EQ(p2.y, 250);
  EXPECT_DOUBLE_EQ(p3.x, 640);
  EXPECT_DOUBLE_EQ(p3.y, 250);
  EXPECT_EQ(thumbwar::RoleName(thumbwar::Role::kP3), "P3");
}
