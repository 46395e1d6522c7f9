#include "game_catalog.hpp"

#include <fmt/format.h>

#include <stdexcept>

#include "common/constants.hpp"
#include "games/math_quiz.hpp"
#include "games/speed_typing.hpp"
#include "games/trivia_race.hpp"

namespace mayhem::games {

auto gameInfo(GameNumber game) -> std::optional<GameInfo> {
  switch (game) {
    case constants::kMathQuizGame:
      return GameInfo{game, "Math Quiz",
                      "Solve as many sums as you can before time runs out."};
    case constants::kSpeedTypingGame:
      return GameInfo{game, "Speed Typing",
                      "Type the words in order. Every correct word scores."};
    case constants::kTriviaRaceGame:
      return GameInfo{game, "Trivia Race",
                      "Answer right to step forward, wrong to step back. "
                      "First to the finish line wins the biggest bonus."};
    default:
      return std::nullopt;
  }
}

auto toJson(const GameInfo& info) -> nlohmann::json {
  return {{"number", info.number},
          {"name", info.name},
          {"description", info.description}};
}

auto makeMinigameFactory(const core::TournamentConfig& config)
    -> MinigameFactory {
  return [config](GameNumber game) -> std::unique_ptr<Minigame> {
    switch (game) {
      case constants::kMathQuizGame:
        return std::make_unique<MathQuiz>(config.math_duration);
      case constants::kSpeedTypingGame:
        return std::make_unique<SpeedTyping>(config.typing_duration,
                                             config.typing_word_count);
      case constants::kTriviaRaceGame:
        return std::make_unique<TriviaRace>(config.race_duration,
                                            config.race_finish_line,
                                            config.allow_test_mode);
      default:
        throw std::invalid_argument(
            fmt::format("Unknown minigame number: {}", game));
    }
  };
}

}  // namespace mayhem::games
