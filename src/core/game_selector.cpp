#include "game_selector.hpp"

#include <algorithm>

#include "common/constants.hpp"

namespace mayhem::core {

namespace {

auto inLastEntries(const std::vector<GameNumber>& history, GameNumber game,
                   std::size_t window) -> bool {
  const auto count = std::min(window, history.size());
  return std::find(history.end() - static_cast<std::ptrdiff_t>(count),
                   history.end(), game) != history.end();
}

auto candidatesExcluding(const std::vector<GameNumber>& history,
                         std::size_t window) -> std::vector<GameNumber> {
  std::vector<GameNumber> candidates;
  for (auto game : constants::kAllGames) {
    if (!inLastEntries(history, game, window)) {
      candidates.push_back(game);
    }
  }
  return candidates;
}

}  // namespace

auto candidateWeights(const std::vector<GameNumber>& history)
    -> std::vector<std::pair<GameNumber, double>> {
  auto candidates =
      candidatesExcluding(history, constants::kRecentExclusionWindow);
  if (candidates.empty()) {
    candidates = candidatesExcluding(history, 1);
  }
  if (candidates.empty()) {
    candidates.assign(constants::kAllGames.begin(),
                      constants::kAllGames.end());
  }

  std::vector<std::pair<GameNumber, double>> weighted;
  weighted.reserve(candidates.size());
  for (auto game : candidates) {
    double weight = constants::kBaseGameWeight;
    if (std::find(history.begin(), history.end(), game) == history.end()) {
      weight = constants::kUnplayedGameWeight;
    } else if (history.size() >= constants::kRecencyWindow &&
               !inLastEntries(history, game, constants::kRecencyWindow)) {
      weight = constants::kNotRecentGameWeight;
    }
    weighted.emplace_back(game, weight);
  }
  return weighted;
}

auto selectNextGame(std::vector<GameNumber>& history, std::mt19937& rng)
    -> GameNumber {
  auto weighted = candidateWeights(history);

  std::vector<double> weights;
  weights.reserve(weighted.size());
  for (const auto& [game, weight] : weighted) {
    weights.push_back(weight);
  }

  std::discrete_distribution<std::size_t> pick(weights.begin(), weights.end());
  const auto chosen = weighted[pick(rng)].first;
  history.push_back(chosen);
  return chosen;
}

}  // namespace mayhem::core
