#include <gtest/gtest.h>

#include "protocol/messages.hpp"

using namespace mayhem::protocol;

TEST(MessagesTest, DecodesKnownEvents) {
  auto event = decodeClientEvent(R"({"type":"JOIN_LOBBY","lobby_id":"abc123"})");
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->type, EventType::JoinLobby);
  EXPECT_EQ(event->body["lobby_id"], "abc123");
}

TEST(MessagesTest, EveryEventNameRoundTrips) {
  for (auto type : {EventType::CreateLobby, EventType::JoinLobby,
                    EventType::UpdateProfile, EventType::ToggleReady,
                    EventType::LeaveLobby, EventType::StartGame,
                    EventType::SubmitAnswer, EventType::SubmitWord,
                    EventType::SubmitRaceAnswer, EventType::ListLobbies}) {
    EXPECT_EQ(parseEventType(eventTypeName(type)), type);
  }
  EXPECT_FALSE(parseEventType("join_lobby").has_value());
}

TEST(MessagesTest, RejectsMalformedMessages) {
  auto garbage = decodeClientEvent("{not json");
  ASSERT_FALSE(garbage.has_value());
  EXPECT_EQ(garbage.error().message, "Malformed JSON");

  auto array = decodeClientEvent("[1,2,3]");
  ASSERT_FALSE(array.has_value());
  EXPECT_EQ(array.error().message, "Message must be a JSON object");

  auto untyped = decodeClientEvent(R"({"lobby_id":"X"})");
  ASSERT_FALSE(untyped.has_value());
  EXPECT_EQ(untyped.error().message, "Missing event type");

  auto numeric_type = decodeClientEvent(R"({"type":5})");
  ASSERT_FALSE(numeric_type.has_value());
  EXPECT_EQ(numeric_type.error().message, "Missing event type");

  auto unknown = decodeClientEvent(R"({"type":"FLY_AWAY"})");
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error().message, "Unknown event type: FLY_AWAY");
}

TEST(MessagesTest, ReadIntAcceptsNumericStrings) {
  nlohmann::json body = {{"a", 7},   {"b", "12"}, {"c", " 3 "}, {"d", "x1"},
                         {"e", 2.0}, {"f", 2.5},  {"g", "4x"},  {"h", true}};
  EXPECT_EQ(readInt(body, "a"), 7);
  EXPECT_EQ(readInt(body, "b"), 12);
  EXPECT_EQ(readInt(body, "c"), 3);
  EXPECT_FALSE(readInt(body, "d").has_value());
  EXPECT_EQ(readInt(body, "e"), 2);
  EXPECT_FALSE(readInt(body, "f").has_value());
  EXPECT_FALSE(readInt(body, "g").has_value());
  EXPECT_FALSE(readInt(body, "h").has_value());
  EXPECT_FALSE(readInt(body, "missing").has_value());
  EXPECT_FALSE(readInt(nlohmann::json::array(), "a").has_value());
}

TEST(MessagesTest, ReadIntRejectsValuesOutsideIntRange) {
  // 4294967303 截断为int后恰好是7
  nlohmann::json body = {{"wrap", 4294967303LL},
                         {"big_unsigned", 18446744073709551615ULL},
                         {"below", -2147483649LL},
                         {"huge_float", 1e300},
                         {"tiny_float", -1e300},
                         {"long_string", "99999999999"},
                         {"max", 2147483647},
                         {"min", -2147483647 - 1},
                         {"max_float", 2147483647.0}};
  EXPECT_FALSE(readInt(body, "wrap").has_value());
  EXPECT_FALSE(readInt(body, "big_unsigned").has_value());
  EXPECT_FALSE(readInt(body, "below").has_value());
  EXPECT_FALSE(readInt(body, "huge_float").has_value());
  EXPECT_FALSE(readInt(body, "tiny_float").has_value());
  EXPECT_FALSE(readInt(body, "long_string").has_value());
  EXPECT_EQ(readInt(body, "max"), 2147483647);
  EXPECT_EQ(readInt(body, "min"), -2147483647 - 1);
  EXPECT_EQ(readInt(body, "max_float"), 2147483647);

  auto parsed = decodeClientEvent(
      R"({"type":"SUBMIT_ANSWER","answer":4294967303})");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_FALSE(readInt(parsed->body, "answer").has_value());
}

TEST(MessagesTest, ReadStringAndBoolAreStrict) {
  nlohmann::json body = {{"s", "hi"}, {"n", 1}, {"b", true}, {"bs", "true"}};
  EXPECT_EQ(readString(body, "s"), "hi");
  EXPECT_FALSE(readString(body, "n").has_value());
  EXPECT_EQ(readBool(body, "b"), true);
  EXPECT_FALSE(readBool(body, "bs").has_value());
}

TEST(MessagesTest, OutboundEnvelope) {
  auto encoded = nlohmann::json::parse(
      encodeEvent(outbound::kLobbyLeft, nlohmann::json::object()));
  EXPECT_EQ(encoded["type"], "LOBBY_LEFT");
  EXPECT_TRUE(encoded["payload"].is_object());

  auto error = nlohmann::json::parse(encodeError("Lobby full"));
  EXPECT_EQ(error["type"], "ERROR");
  EXPECT_EQ(error["msg"], "Lobby full");
  EXPECT_FALSE(error.contains("payload"));
}

TEST(MessagesTest, GameStartNames) {
  EXPECT_EQ(gameStartEventName(1), "GAME_1_START");
  EXPECT_EQ(gameStartEventName(3), "GAME_3_START");
  EXPECT_TRUE(isGameInput(EventType::SubmitWord));
  EXPECT_FALSE(isGameInput(EventType::StartGame));
}
