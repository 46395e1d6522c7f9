#include "leaderboard.hpp"

#include <algorithm>

namespace mayhem::core {

auto ranksBefore(const LeaderboardEntry& lhs, const LeaderboardEntry& rhs)
    -> bool {
  if (lhs.score != rhs.score) {
    return lhs.score > rhs.score;
  }
  if (lhs.last_update != rhs.last_update) {
    if (!lhs.last_update) return false;
    if (!rhs.last_update) return true;
    return *lhs.last_update < *rhs.last_update;
  }
  return lhs.player_id < rhs.player_id;
}

void rankLeaderboard(std::vector<LeaderboardEntry>& entries) {
  std::sort(entries.begin(), entries.end(), ranksBefore);
}

auto toJson(const LeaderboardEntry& entry) -> nlohmann::json {
  return {{"player_id", entry.player_id},
          {"username", entry.username},
          {"color", entry.color},
          {"shape", entry.shape},
          {"score", entry.score},
          {"eliminated", entry.eliminated},
          {"connected", entry.connected}};
}

auto toJson(const std::vector<LeaderboardEntry>& entries) -> nlohmann::json {
  auto list = nlohmann::json::array();
  for (const auto& entry : entries) {
    list.push_back(toJson(entry));
  }
  return list;
}

}  // namespace mayhem::core
