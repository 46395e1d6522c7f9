#include <gtest/gtest.h>

#include "core/player.hpp"
#include "utils/recording_sink.hpp"

using namespace mayhem;
using namespace mayhem::core;
using mayhem::test::RecordingSink;

TEST(ShapeTest, ParseIsCaseInsensitive) {
  EXPECT_EQ(parseShape("Star"), Shape::Star);
  EXPECT_EQ(parseShape("hexagon"), Shape::Hexagon);
  EXPECT_FALSE(parseShape("blob").has_value());
  EXPECT_EQ(shapeToString(Shape::Triangle), "triangle");
}

TEST(PlayerTest, DefaultsAndJson) {
  auto sink = std::make_shared<RecordingSink>();
  Player player("c1", "alice", sink);

  auto json = player.toJson();
  EXPECT_EQ(json["id"], "c1");
  EXPECT_EQ(json["username"], "alice");
  EXPECT_EQ(json["color"], kDefaultPlayerColor);
  EXPECT_EQ(json["shape"], "circle");
  EXPECT_EQ(json["is_ready"], false);
  EXPECT_EQ(json["is_host"], false);
}

TEST(PlayerTest, UpdateProfile) {
  auto sink = std::make_shared<RecordingSink>();
  Player player("c1", "alice", sink);
  player.updateProfile("#ff0000", Shape::Square);

  EXPECT_EQ(player.color(), "#ff0000");
  EXPECT_EQ(player.shape(), Shape::Square);
}

TEST(PlayerTest, SendAfterSinkIsGoneIsDropped) {
  auto sink = std::make_shared<RecordingSink>();
  Player player("c1", "alice", sink);

  player.send(R"({"type":"PING"})");
  EXPECT_EQ(sink->count("PING"), 1u);
  EXPECT_TRUE(player.isConnected());

  sink.reset();
  EXPECT_FALSE(player.isConnected());
  EXPECT_NO_THROW(player.send(R"({"type":"PING"})"));
}
