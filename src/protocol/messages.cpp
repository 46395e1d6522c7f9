#include "messages.hpp"

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace mayhem::protocol {

namespace {

constexpr std::array<std::pair<EventType, const char*>, 10> kEventNames = {{
    {EventType::CreateLobby, "CREATE_LOBBY"},
    {EventType::JoinLobby, "JOIN_LOBBY"},
    {EventType::UpdateProfile, "UPDATE_PROFILE"},
    {EventType::ToggleReady, "TOGGLE_READY"},
    {EventType::LeaveLobby, "LEAVE_LOBBY"},
    {EventType::StartGame, "START_GAME"},
    {EventType::SubmitAnswer, "SUBMIT_ANSWER"},
    {EventType::SubmitWord, "SUBMIT_WORD"},
    {EventType::SubmitRaceAnswer, "SUBMIT_RACE_ANSWER"},
    {EventType::ListLobbies, "LIST_LOBBIES"},
}};

}  // namespace

auto eventTypeName(EventType type) -> const char* {
  for (const auto& [value, name] : kEventNames) {
    if (value == type) {
      return name;
    }
  }
  return "UNKNOWN";
}

auto parseEventType(const std::string& name) -> std::optional<EventType> {
  for (const auto& [value, event_name] : kEventNames) {
    if (name == event_name) {
      return value;
    }
  }
  return std::nullopt;
}

auto isGameInput(EventType type) -> bool {
  return type == EventType::SubmitAnswer || type == EventType::SubmitWord ||
         type == EventType::SubmitRaceAnswer;
}

auto decodeClientEvent(const std::string& raw)
    -> tl::expected<ClientEvent, ProtocolError> {
  auto body = nlohmann::json::parse(raw, nullptr, false);
  if (body.is_discarded()) {
    return tl::make_unexpected(ProtocolError{"Malformed JSON"});
  }
  if (!body.is_object()) {
    return tl::make_unexpected(ProtocolError{"Message must be a JSON object"});
  }

  auto type_name = readString(body, "type");
  if (!type_name) {
    return tl::make_unexpected(ProtocolError{"Missing event type"});
  }

  auto type = parseEventType(*type_name);
  if (!type) {
    return tl::make_unexpected(
        ProtocolError{fmt::format("Unknown event type: {}", *type_name)});
  }

  return ClientEvent{*type, std::move(body)};
}

auto readInt(const nlohmann::json& body, const char* key)
    -> std::optional<int> {
  if (!body.is_object() || !body.contains(key)) {
    return std::nullopt;
  }
  constexpr auto kMin = std::numeric_limits<int>::min();
  constexpr auto kMax = std::numeric_limits<int>::max();

  const auto& value = body[key];
  if (value.is_number_unsigned()) {
    const auto u = value.get<std::uint64_t>();
    if (u > static_cast<std::uint64_t>(kMax)) {
      return std::nullopt;
    }
    return static_cast<int>(u);
  }
  if (value.is_number_integer()) {
    const auto i = value.get<std::int64_t>();
    if (i < kMin || i > kMax) {
      return std::nullopt;
    }
    return static_cast<int>(i);
  }
  if (value.is_number_float()) {
    // 先检查范围，越界的浮点数转换为int是未定义行为
    const auto d = value.get<double>();
    if (!(d >= static_cast<double>(kMin) && d <= static_cast<double>(kMax))) {
      return std::nullopt;
    }
    if (d != std::trunc(d)) {
      return std::nullopt;
    }
    return static_cast<int>(d);
  }
  if (value.is_string()) {
    const auto& text = value.get_ref<const std::string&>();
    try {
      size_t consumed = 0;
      int parsed = std::stoi(text, &consumed);
      // 允许首尾空白，但不允许多余字符
      while (consumed < text.size() && std::isspace(static_cast<unsigned char>(
                                           text[consumed])) != 0) {
        ++consumed;
      }
      if (consumed == text.size()) {
        return parsed;
      }
    } catch (const std::exception&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

auto readString(const nlohmann::json& body, const char* key)
    -> std::optional<std::string> {
  if (!body.is_object() || !body.contains(key) || !body[key].is_string()) {
    return std::nullopt;
  }
  return body[key].get<std::string>();
}

auto readBool(const nlohmann::json& body, const char* key)
    -> std::optional<bool> {
  if (!body.is_object() || !body.contains(key) || !body[key].is_boolean()) {
    return std::nullopt;
  }
  return body[key].get<bool>();
}

auto gameStartEventName(GameNumber game) -> std::string {
  return fmt::format("GAME_{}_START", game);
}

auto encodeEvent(const std::string& type, const nlohmann::json& payload)
    -> std::string {
  nlohmann::json message = {{"type", type}, {"payload", payload}};
  return message.dump();
}

auto encodeError(const std::string& message) -> std::string {
  nlohmann::json error = {{"type", outbound::kError}, {"msg", message}};
  return error.dump();
}

}  // namespace mayhem::protocol
