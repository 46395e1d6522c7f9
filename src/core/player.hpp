#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "common/types.hpp"
#include "core/message_sink.hpp"

namespace mayhem::core {

/**
 * @brief 头像形状
 */
enum class Shape : std::uint8_t { Circle, Square, Triangle, Star, Hexagon };

auto shapeToString(Shape shape) -> std::string;
auto parseShape(const std::string& name) -> std::optional<Shape>;

constexpr const char* kDefaultPlayerColor = "#4a148c";

/**
 * @brief 一个已连接的玩家
 *
 * 每个传输连接对应一个Player。资料字段（颜色、形状）由玩家自己修改；
 * 准备/房主标志和所在大厅由Lobby修改。所有访问都是线程安全的。
 */
class Player {
 public:
  Player(ConnectionId id, Username username, std::weak_ptr<MessageSink> sink);

  Player(const Player&) = delete;
  auto operator=(const Player&) -> Player& = delete;

  [[nodiscard]] auto id() const -> const ConnectionId& { return id_; }

  auto username() const -> Username;
  void setUsername(const Username& username);

  auto color() const -> std::string;
  auto shape() const -> Shape;
  void updateProfile(const std::string& color, Shape shape);

  auto isReady() const -> bool;
  void setReady(bool ready);

  auto isHost() const -> bool;
  void setHost(bool host);

  auto lobbyId() const -> std::optional<LobbyCode>;
  void setLobbyId(std::optional<LobbyCode> lobby_id);

  /**
   * @brief 向该玩家的连接发送消息
   *
   * 连接已关闭时静默丢弃。传输层的异常会继续向上抛出。
   */
  void send(const std::string& message) const;

  auto isConnected() const -> bool { return !sink_.expired(); }

  // {id, username, color, shape, is_ready, is_host}
  auto toJson() const -> nlohmann::json;

 private:
  const ConnectionId id_;
  std::weak_ptr<MessageSink> sink_;

  mutable std::mutex mutex_;
  Username username_;
  std::string color_ = kDefaultPlayerColor;
  Shape shape_ = Shape::Circle;
  bool is_ready_ = false;
  bool is_host_ = false;
  std::optional<LobbyCode> lobby_id_;
};

}  // namespace mayhem::core
