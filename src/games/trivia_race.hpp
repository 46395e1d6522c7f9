#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "games/minigame.hpp"

namespace mayhem::games {

struct TriviaQuestion {
  std::string text;
  std::vector<std::string> options;
  // 只保存在服务器端
  int answer_index = 0;
};

/// @brief 内置的技术知识题库
auto defaultTriviaPool() -> std::vector<TriviaQuestion>;

/**
 * @brief 答题赛跑
 *
 * 每名参赛玩家在 [0, finish_line] 的赛道上移动：答对前进一步，答错后退一步。
 * 到达终点的玩家按先后获得名次奖励，之后的输入被忽略。
 * 全部参赛玩家到达终点时本局提前结束。
 *
 * 判题在服务器端进行：每名玩家有自己的题目游标，答完一题后前进并在题库末尾回绕。
 */
class TriviaRace : public Minigame {
 public:
  /**
   * @param trust_client_grading 为true时接受客户端自报的 is_correct（仅测试模式）
   */
  TriviaRace(std::chrono::milliseconds duration, int finish_line,
             bool trust_client_grading,
             std::vector<TriviaQuestion> pool = defaultTriviaPool(),
             std::uint32_t seed = std::random_device{}());

  /**
   * @brief 按判定结果移动玩家
   *
   * 已到达终点的玩家不再移动。
   */
  void applyAnswer(RoundContext& context, const PlayerHandle& player,
                   bool correct);

  auto position(const PlayerHandle& player) const -> int;
  auto isFinished(const PlayerHandle& player) const -> bool;
  auto finishers() const -> const std::vector<PlayerHandle>& {
    return finishers_;
  }
  auto questions() const -> const std::vector<TriviaQuestion>& {
    return pool_;
  }
  /// @brief 玩家当前应回答的题目下标
  auto questionIndex(const PlayerHandle& player) const -> std::size_t;

  [[nodiscard]] auto gameNumber() const -> GameNumber override;
  [[nodiscard]] auto duration() const -> std::chrono::milliseconds override {
    return duration_;
  }
  [[nodiscard]] auto acceptsInput(protocol::EventType type) const
      -> bool override;
  [[nodiscard]] auto currentScore(const PlayerHandle& player) const
      -> std::optional<int> override;
  [[nodiscard]] auto isComplete(const RoundContext& context) const
      -> bool override;

 protected:
  void onBegin(RoundContext& context) override;
  void onInput(RoundContext& context, const PlayerHandle& player,
               const nlohmann::json& body) override;
  void onRejoin(RoundContext& context, const PlayerHandle& player) override;

 private:
  struct Lane {
    int position = 0;
    std::size_t cursor = 0;
    bool finished = false;
  };

  auto finishBonus(std::size_t rank) const -> int;
  auto startPayload() const -> nlohmann::json;

  const std::chrono::milliseconds duration_;
  const int finish_line_;
  const bool trust_client_grading_;
  std::vector<TriviaQuestion> pool_;
  std::mt19937 rng_;
  std::map<PlayerHandle, Lane> lanes_;
  std::vector<PlayerHandle> finishers_;
};

}  // namespace mayhem::games
