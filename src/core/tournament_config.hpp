#pragma once

#include <chrono>
#include <cstddef>

#include "common/constants.hpp"

namespace mayhem::common {
class ConfigManager;
}

namespace mayhem::core {

/**
 * @brief 锦标赛的全部时序与规则常量
 *
 * 默认值与线上行为一致，可由配置文件的 tournament.* 键覆盖。
 */
struct TournamentConfig {
  int max_rounds = constants::kDefaultMaxRounds;
  std::chrono::milliseconds preview_delay = constants::kDefaultPreviewDelay;
  std::chrono::milliseconds intermission_delay =
      constants::kDefaultIntermissionDelay;

  std::chrono::milliseconds math_duration = constants::kMathQuizDuration;
  std::chrono::milliseconds typing_duration = constants::kSpeedTypingDuration;
  std::chrono::milliseconds race_duration = constants::kTriviaRaceDuration;

  std::size_t typing_word_count = constants::kDefaultWordCount;
  int race_finish_line = constants::kTriviaFinishLine;

  // 允许 START_GAME{test_mode} 跳过准备检查，以及答题赛跑的客户端判题
  bool allow_test_mode = false;

  static auto loadFrom(const common::ConfigManager& config)
      -> TournamentConfig;
};

}  // namespace mayhem::core
