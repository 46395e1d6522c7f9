#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>

#include "common/types.hpp"
#include "core/lobby.hpp"
#include "core/tournament_config.hpp"
#include "games/game_catalog.hpp"
#include "storage/profile_store.hpp"

namespace mayhem::core {

namespace net = boost::asio;

/**
 * @brief 锦标赛编排器：一个大厅的回合状态机
 *
 * LOBBY -> PREVIEW -> RUNNING -> ROUND_END -> (PREVIEW | FINISHED)
 *
 * 所有阶段切换都在同一个 strand 上执行，定时器也绑定在该 strand 上；
 * 大厅状态本身由 Lobby 的锁保护。编排器只持有大厅的弱引用，
 * 大厅销毁后到期的定时器不做任何事。
 */
class Tournament : public std::enable_shared_from_this<Tournament> {
 public:
  Tournament(const net::any_io_executor& executor, std::weak_ptr<Lobby> lobby,
             TournamentConfig config, games::MinigameFactory factory,
             std::shared_ptr<storage::ProfileStore> profiles = nullptr,
             std::uint32_t seed = std::random_device{}());

  Tournament(const Tournament&) = delete;
  auto operator=(const Tournament&) -> Tournament& = delete;

  /**
   * @brief 房主发起锦标赛
   *
   * 前置条件同步检查，之后的阶段在 strand 上异步推进。
   * test_mode 只有在配置允许时才会跳过准备检查。
   */
  auto start(const Username& requester, bool test_mode) -> LobbyResult<void>;

  /**
   * @brief 转发小游戏输入；满足提前结束条件时立即结算本局
   */
  auto submitInput(const ConnectionId& id, protocol::EventType type,
                   const nlohmann::json& body) -> LobbyResult<void>;

  /// @brief 取消所有未到期的定时器，之后不再推进
  void cancel();

  [[nodiscard]] auto config() const -> const TournamentConfig& {
    return config_;
  }

 private:
  void schedule(std::chrono::milliseconds delay, std::function<void()> step);
  void runPreview(GameNumber game);
  void runRound(GameNumber game);
  void endRound(std::uint64_t serial);
  void completeTournament(Lobby& lobby);
  void recordStatistics(const TournamentResult& result);

  net::strand<net::any_io_executor> strand_;
  net::steady_timer timer_;
  std::weak_ptr<Lobby> lobby_;
  const TournamentConfig config_;
  games::MinigameFactory factory_;
  std::shared_ptr<storage::ProfileStore> profiles_;

  // 以下仅在 strand_ 上访问
  std::mt19937 rng_;

  // 当前局的序号，与 Lobby::beginRound 的返回值一致
  std::atomic<std::uint64_t> round_serial_{0};
  std::atomic<bool> cancelled_{false};
};

}  // namespace mayhem::core
