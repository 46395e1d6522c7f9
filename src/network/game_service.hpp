#pragma once

#include <boost/asio.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "common/types.hpp"
#include "core/connection_registry.hpp"
#include "core/lobby_directory.hpp"
#include "core/message_sink.hpp"
#include "core/tournament_config.hpp"
#include "games/game_catalog.hpp"
#include "protocol/messages.hpp"
#include "storage/profile_store.hpp"

namespace mayhem::network {

/**
 * @brief 游戏服务：连接注册表与大厅目录的所有者，并分发入站事件
 *
 * 传输层只与此类交互：连接建立、消息到达、连接关闭。
 * 每个实例相互独立，测试可以直接构造。
 */
class GameService {
 public:
  GameService(boost::asio::any_io_executor executor,
              core::TournamentConfig config, games::MinigameFactory factory,
              std::shared_ptr<storage::ProfileStore> profiles = nullptr);

  GameService(const GameService&) = delete;
  auto operator=(const GameService&) -> GameService& = delete;

  /**
   * @brief 已验证身份的连接建立
   *
   * 注册连接，应用已保存的资料，并发送 CONNECTED。
   */
  auto onConnectionOpened(const std::shared_ptr<core::MessageSink>& sink,
                          const Username& username)
      -> std::shared_ptr<core::Player>;

  /**
   * @brief 连接关闭：注销并离开所在大厅。幂等。
   */
  void onConnectionClosed(const ConnectionId& id);

  /**
   * @brief 处理一条入站消息
   *
   * 协议错误与处理中的异常都以 ERROR 回复发送者，不会传播到I/O循环。
   */
  void processMessage(const ConnectionId& id, const std::string& raw_message);

  /// @brief 所有大厅的摘要（REST 与 LIST_LOBBIES 共用）
  auto lobbyListing() const -> nlohmann::json;

  auto registry() -> core::ConnectionRegistry& { return registry_; }
  auto directory() -> core::LobbyDirectory& { return directory_; }

 private:
  using PlayerPtr = std::shared_ptr<core::Player>;

  void dispatch(const PlayerPtr& player, const protocol::ClientEvent& event);

  void handleCreateLobby(const PlayerPtr& player, const nlohmann::json& body);
  void handleJoinLobby(const PlayerPtr& player, const nlohmann::json& body);
  void handleUpdateProfile(const PlayerPtr& player, const nlohmann::json& body);
  void handleToggleReady(const PlayerPtr& player);
  void handleLeaveLobby(const PlayerPtr& player);
  void handleStartGame(const PlayerPtr& player, const nlohmann::json& body);
  void handleGameInput(const PlayerPtr& player,
                       const protocol::ClientEvent& event);
  void handleListLobbies(const PlayerPtr& player);

  auto currentLobby(const core::Player& player) const
      -> std::shared_ptr<core::Lobby>;
  void leaveCurrentLobby(const PlayerPtr& player);
  void sendJoined(const core::Player& player, const core::Lobby& lobby,
                  core::JoinKind kind);
  void saveProfile(const core::Player& player);

  static void replyError(const core::Player& player, const std::string& message);

  core::ConnectionRegistry registry_;
  core::LobbyDirectory directory_;
  std::shared_ptr<storage::ProfileStore> profiles_;
};

}  // namespace mayhem::network
