#include "tournament_config.hpp"

#include <algorithm>

#include "common/config_manager.hpp"

namespace mayhem::core {

namespace {

auto readDelay(const common::ConfigManager& config, const std::string& key,
               std::chrono::milliseconds fallback)
    -> std::chrono::milliseconds {
  const int value =
      config.getWithDefault<int>(key, static_cast<int>(fallback.count()));
  return std::chrono::milliseconds(std::max(value, 0));
}

}  // namespace

auto TournamentConfig::loadFrom(const common::ConfigManager& config)
    -> TournamentConfig {
  TournamentConfig result;
  result.max_rounds = std::max(
      1, config.getWithDefault<int>("tournament.max_rounds", result.max_rounds));
  result.preview_delay = readDelay(config, "tournament.preview_delay_ms",
                                   result.preview_delay);
  result.intermission_delay = readDelay(
      config, "tournament.intermission_delay_ms", result.intermission_delay);
  result.math_duration =
      readDelay(config, "tournament.math_duration_ms", result.math_duration);
  result.typing_duration = readDelay(config, "tournament.typing_duration_ms",
                                     result.typing_duration);
  result.race_duration =
      readDelay(config, "tournament.race_duration_ms", result.race_duration);

  const int word_count = config.getWithDefault<int>(
      "tournament.typing_word_count",
      static_cast<int>(result.typing_word_count));
  result.typing_word_count = static_cast<std::size_t>(std::max(word_count, 1));
  result.race_finish_line = std::max(
      1, config.getWithDefault<int>("tournament.race_finish_line",
                                    result.race_finish_line));
  result.allow_test_mode = config.getWithDefault<bool>(
      "tournament.allow_test_mode", result.allow_test_mode);
  return result;
}

}  // namespace mayhem::core
