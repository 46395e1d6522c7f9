#pragma once

#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <random>
#include <unordered_map>
#include <vector>

#include "common/types.hpp"
#include "core/lobby.hpp"
#include "core/player.hpp"
#include "core/tournament_config.hpp"
#include "games/game_catalog.hpp"
#include "storage/profile_store.hpp"

namespace mayhem::core {

/**
 * @brief 大厅目录：大厅代码到大厅的映射
 *
 * 创建大厅时为其附加一个锦标赛编排器。此类是线程安全的。
 */
class LobbyDirectory {
 public:
  LobbyDirectory(boost::asio::any_io_executor executor, TournamentConfig config,
                 games::MinigameFactory factory,
                 std::shared_ptr<storage::ProfileStore> profiles = nullptr);
  ~LobbyDirectory();

  LobbyDirectory(const LobbyDirectory&) = delete;
  auto operator=(const LobbyDirectory&) -> LobbyDirectory& = delete;

  /**
   * @brief 创建大厅并让 host 以房主身份加入
   *
   * 代码为6位大写十六进制字符，冲突时重新生成。容量被限制在 [5, 50]。
   */
  auto createLobby(const std::shared_ptr<Player>& host, int capacity)
      -> LobbyResult<std::shared_ptr<Lobby>>;

  auto getLobby(const LobbyCode& code) const -> std::shared_ptr<Lobby>;

  /**
   * @brief 移除大厅并取消其未到期的定时器。幂等。
   */
  void removeLobby(const LobbyCode& code);

  auto listSummaries() const -> std::vector<LobbySummary>;
  auto lobbyCount() const -> std::size_t;

  [[nodiscard]] auto config() const -> const TournamentConfig& {
    return config_;
  }

 private:
  auto generateCodeNoLock() -> LobbyCode;

  boost::asio::any_io_executor executor_;
  const TournamentConfig config_;
  games::MinigameFactory factory_;
  std::shared_ptr<storage::ProfileStore> profiles_;

  mutable std::mutex mutex_;
  std::unordered_map<LobbyCode, std::shared_ptr<Lobby>> lobbies_;
  std::mt19937 rng_;
};

}  // namespace mayhem::core
