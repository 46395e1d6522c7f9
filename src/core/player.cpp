#include "player.hpp"

#include <algorithm>
#include <cctype>

namespace mayhem::core {

auto shapeToString(Shape shape) -> std::string {
  switch (shape) {
    case Shape::Circle:
      return "circle";
    case Shape::Square:
      return "square";
    case Shape::Triangle:
      return "triangle";
    case Shape::Star:
      return "star";
    case Shape::Hexagon:
      return "hexagon";
  }
  return "circle";
}

auto parseShape(const std::string& name) -> std::optional<Shape> {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "circle") return Shape::Circle;
  if (lower == "square") return Shape::Square;
  if (lower == "triangle") return Shape::Triangle;
  if (lower == "star") return Shape::Star;
  if (lower == "hexagon") return Shape::Hexagon;
  return std::nullopt;
}

Player::Player(ConnectionId id, Username username,
               std::weak_ptr<MessageSink> sink)
    : id_(std::move(id)),
      sink_(std::move(sink)),
      username_(std::move(username)) {}

auto Player::username() const -> Username {
  std::lock_guard lock(mutex_);
  return username_;
}

void Player::setUsername(const Username& username) {
  std::lock_guard lock(mutex_);
  username_ = username;
}

auto Player::color() const -> std::string {
  std::lock_guard lock(mutex_);
  return color_;
}

auto Player::shape() const -> Shape {
  std::lock_guard lock(mutex_);
  return shape_;
}

void Player::updateProfile(const std::string& color, Shape shape) {
  std::lock_guard lock(mutex_);
  color_ = color;
  shape_ = shape;
}

auto Player::isReady() const -> bool {
  std::lock_guard lock(mutex_);
  return is_ready_;
}

void Player::setReady(bool ready) {
  std::lock_guard lock(mutex_);
  is_ready_ = ready;
}

auto Player::isHost() const -> bool {
  std::lock_guard lock(mutex_);
  return is_host_;
}

void Player::setHost(bool host) {
  std::lock_guard lock(mutex_);
  is_host_ = host;
}

auto Player::lobbyId() const -> std::optional<LobbyCode> {
  std::lock_guard lock(mutex_);
  return lobby_id_;
}

void Player::setLobbyId(std::optional<LobbyCode> lobby_id) {
  std::lock_guard lock(mutex_);
  lobby_id_ = std::move(lobby_id);
}

void Player::send(const std::string& message) const {
  if (auto sink = sink_.lock()) {
    sink->send(message);
  }
}

auto Player::toJson() const -> nlohmann::json {
  std::lock_guard lock(mutex_);
  return {{"id", id_},
          {"username", username_},
          {"color", color_},
          {"shape", shapeToString(shape_)},
          {"is_ready", is_ready_},
          {"is_host", is_host_}};
}

}  // namespace mayhem::core
