#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "games/minigame.hpp"

namespace mayhem::games {

/**
 * @brief 打字竞速
 *
 * 开局时向全体广播同一份单词表。玩家按顺序输入，每个正确的单词加1分，
 * 并向所有人广播最新排行榜。
 */
class SpeedTyping : public Minigame {
 public:
  SpeedTyping(std::chrono::milliseconds duration, std::size_t word_count,
              std::uint32_t seed = std::random_device{}());

  /// @brief 忽略首尾空白与大小写的比较
  static auto checkWord(const std::string& expected, const std::string& typed)
      -> bool;

  static auto wordSource() -> const std::vector<std::string>&;

  auto words() const -> const std::vector<std::string>& { return words_; }
  void setWords(std::vector<std::string> words) { words_ = std::move(words); }

  /// @brief 玩家已正确输入的单词数
  auto progress(const PlayerHandle& player) const -> std::size_t;

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
  auto generateWords() -> std::vector<std::string>;

  const std::chrono::milliseconds duration_;
  const std::size_t word_count_;
  std::mt19937 rng_;
  std::vector<std::string> words_;
  std::map<PlayerHandle, std::size_t> cursors_;
};

}  // namespace mayhem::games
