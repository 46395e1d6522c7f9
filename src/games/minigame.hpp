#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>

#include "common/types.hpp"
#include "games/round_context.hpp"
#include "protocol/messages.hpp"

namespace mayhem::games {

/**
 * @brief 小游戏策略的统一接口
 *
 * 每局新建一个实例，局结束后丢弃。实例只保存本局数据，
 * 以玩家句柄为键。所有方法都在大厅锁内被调用，因此实现无需自行同步。
 *
 * 生命周期：begin() 之后为活动状态，finish() 之后不再处理任何输入。
 * 计时由锦标赛编排器负责，小游戏只通过 isComplete() 报告提前结束。
 */
class Minigame {
 public:
  virtual ~Minigame() = default;

  Minigame(const Minigame&) = delete;
  auto operator=(const Minigame&) -> Minigame& = delete;

  [[nodiscard]] virtual auto gameNumber() const -> GameNumber = 0;
  [[nodiscard]] virtual auto duration() const -> std::chrono::milliseconds = 0;

  /// @brief 该小游戏是否处理此类输入事件
  [[nodiscard]] virtual auto acceptsInput(protocol::EventType type) const
      -> bool = 0;

  /**
   * @brief 开局：进入活动状态并发送开局数据
   */
  void begin(RoundContext& context) {
    active_ = true;
    onBegin(context);
  }

  /**
   * @brief 处理一名参赛玩家的输入；非活动状态下静默丢弃
   */
  void submit(RoundContext& context, const PlayerHandle& player,
              const nlohmann::json& body) {
    if (!active_) {
      return;
    }
    onInput(context, player, body);
  }

  /**
   * @brief 参赛玩家在本局进行中重连
   *
   * 向新连接补发开局数据与该玩家的当前进度；非活动状态下不做任何事。
   */
  void rejoin(RoundContext& context, const PlayerHandle& player) {
    if (!active_) {
      return;
    }
    onRejoin(context, player);
  }

  void finish() { active_ = false; }

  [[nodiscard]] auto isActive() const -> bool { return active_; }

  /**
   * @brief 用于排行榜的当前分数
   *
   * 返回空表示使用大厅记录的本局积分；进度类游戏覆盖为位置。
   */
  [[nodiscard]] virtual auto currentScore(const PlayerHandle& /*player*/) const
      -> std::optional<int> {
    return std::nullopt;
  }

  /// @brief 是否满足提前结束条件
  [[nodiscard]] virtual auto isComplete(const RoundContext& /*context*/) const
      -> bool {
    return false;
  }

 protected:
  Minigame() = default;

  virtual void onBegin(RoundContext& context) = 0;
  virtual void onInput(RoundContext& context, const PlayerHandle& player,
                       const nlohmann::json& body) = 0;
  virtual void onRejoin(RoundContext& context, const PlayerHandle& player) = 0;

  /// @brief 以秒为单位的时长，用于客户端倒计时
  [[nodiscard]] auto durationSeconds() const -> long long {
    return std::chrono::duration_cast<std::chrono::seconds>(duration())
        .count();
  }

 private:
  bool active_ = false;
};

}  // namespace mayhem::games
