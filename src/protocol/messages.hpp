#pragma once

/**
 * @file messages.hpp
 * @brief JSON-over-WebSocket 事件协议
 *
 * 入站消息是扁平的JSON对象：{"type": "...", ...字段}。
 * 出站消息统一为 {"type": T, "payload": {...}}，
 * 错误为 {"type": "ERROR", "msg": "..."}。
 */

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <tl/expected.hpp>

#include "common/types.hpp"

namespace mayhem::protocol {

enum class EventType : std::uint8_t {
  CreateLobby,
  JoinLobby,
  UpdateProfile,
  ToggleReady,
  LeaveLobby,
  StartGame,
  SubmitAnswer,
  SubmitWord,
  SubmitRaceAnswer,
  ListLobbies
};

auto eventTypeName(EventType type) -> const char*;
auto parseEventType(const std::string& name) -> std::optional<EventType>;

/// @brief 是否为小游戏输入事件
auto isGameInput(EventType type) -> bool;

struct ProtocolError {
  std::string message;
};

/**
 * @brief 已解码的入站事件
 *
 * body 保留完整的原始JSON对象，字段由具体处理者读取。
 */
struct ClientEvent {
  EventType type;
  nlohmann::json body;
};

auto decodeClientEvent(const std::string& raw)
    -> tl::expected<ClientEvent, ProtocolError>;

// 宽松的字段读取：数字字符串也被视为整数
auto readInt(const nlohmann::json& body, const char* key) -> std::optional<int>;
auto readString(const nlohmann::json& body, const char* key)
    -> std::optional<std::string>;
auto readBool(const nlohmann::json& body, const char* key)
    -> std::optional<bool>;

// 出站事件类型
namespace outbound {
constexpr const char* kConnected = "CONNECTED";
constexpr const char* kRosterUpdate = "ROSTER_UPDATE";
constexpr const char* kLobbyJoined = "LOBBY_JOINED";
constexpr const char* kLobbyLeft = "LOBBY_LEFT";
constexpr const char* kLobbyList = "LOBBY_LIST";
constexpr const char* kProfileAck = "PROFILE_ACK";
constexpr const char* kGamePreview = "GAME_PREVIEW";
constexpr const char* kNewQuestion = "NEW_QUESTION";
constexpr const char* kNewWords = "NEW_WORDS";
constexpr const char* kGame3Start = "GAME_3_START";
constexpr const char* kAnswerResult = "ANSWER_RESULT";
constexpr const char* kScoreUpdate = "SCORE_UPDATE";
constexpr const char* kPlayerMoved = "PLAYER_MOVED";
constexpr const char* kPlayerFinished = "PLAYER_FINISHED";
constexpr const char* kRoundEnd = "ROUND_END";
constexpr const char* kTournamentWinner = "TOURNAMENT_WINNER";
constexpr const char* kError = "ERROR";
}  // namespace outbound

/// @brief "GAME_<n>_START"
auto gameStartEventName(GameNumber game) -> std::string;

auto encodeEvent(const std::string& type, const nlohmann::json& payload)
    -> std::string;
auto encodeError(const std::string& message) -> std::string;

}  // namespace mayhem::protocol
