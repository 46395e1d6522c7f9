#pragma once

#include <string>
#include <vector>

#include "common/types.hpp"
#include "core/leaderboard.hpp"

namespace mayhem::games {

/// 玩家在一个大厅内的稳定句柄（用户名），重连前后不变
using PlayerHandle = Username;

/**
 * @brief 小游戏在一局中可见的大厅视图
 *
 * 由Lobby在持有自身锁时提供给小游戏。实现不得再次加锁，
 * 小游戏也不得在回调之外保存对它的引用。
 */
class RoundContext {
 public:
  virtual ~RoundContext() = default;

  /// @brief 仍在参赛的玩家，按稳定顺序
  virtual auto activePlayers() const -> std::vector<PlayerHandle> = 0;
  virtual auto isCompeting(const PlayerHandle& player) const -> bool = 0;

  /// @brief 本局累计分数
  virtual auto score(const PlayerHandle& player) const -> int = 0;

  /// @brief 加分，并刷新该玩家的最后得分序号
  virtual void addScore(const PlayerHandle& player, int delta) = 0;

  /// @brief 只刷新最后得分序号（用于同分排序）
  virtual void touch(const PlayerHandle& player) = 0;

  /// @brief 单播；玩家断线时静默丢弃
  virtual void sendTo(const PlayerHandle& player,
                      const std::string& message) = 0;

  /// @brief 向大厅内所有在线成员广播（包括观众）
  virtual void broadcast(const std::string& message) = 0;

  /// @brief 按当前小游戏计分规则排好序的排行榜
  virtual auto leaderboard() const -> std::vector<core::LeaderboardEntry> = 0;
};

}  // namespace mayhem::games
