#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>

#include "games/minigame.hpp"

namespace mayhem::games {

enum class MathOperator : std::uint8_t { Plus, Minus };

struct MathQuestion {
  std::string id;
  std::string text;
  int answer = 0;
};

/**
 * @brief 算术抢答
 *
 * 每名玩家各自拿到一道题，答对加1分并立即收到下一道题。
 * 题目不在全体玩家间同步。
 */
class MathQuiz : public Minigame {
 public:
  explicit MathQuiz(std::chrono::milliseconds duration,
                    std::uint32_t seed = std::random_device{}());

  /**
   * @brief 由给定操作数构造题目
   *
   * 减法时若 num1 < num2 先交换，保证结果非负。
   */
  static auto makeQuestion(int num1, int num2, MathOperator op, std::string id)
      -> MathQuestion;

  /// @brief 随机出题，操作数在 [1, 20]
  auto generateQuestion() -> MathQuestion;

  auto currentQuestion(const PlayerHandle& player) const
      -> std::optional<MathQuestion>;

  /// @brief 指定某玩家的当前题目
  void assignQuestion(const PlayerHandle& player, MathQuestion question);

  [[nodiscard]] auto gameNumber() const -> GameNumber override;
  [[nodiscard]] auto duration() const -> std::chrono::milliseconds override {
    return duration_;
  }
  [[nodiscard]] auto acceptsInput(protocol::EventType type) const
      -> bool override;

 protected:
  void onBegin(RoundContext& context) override;
  void onInput(RoundContext& context, const PlayerHandle& player,
               const nlohmann::json& body) override;
  void onRejoin(RoundContext& context, const PlayerHandle& player) override;

 private:
  void issueQuestion(RoundContext& context, const PlayerHandle& player);

  const std::chrono::milliseconds duration_;
  std::mt19937 rng_;
  std::map<PlayerHandle, MathQuestion> questions_;
};

}  // namespace mayhem::games
