#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"

namespace mayhem::core {

/**
 * @brief 排行榜中的一行
 *
 * player_id 是玩家的稳定句柄（用户名），重连后保持不变。
 */
struct LeaderboardEntry {
  Username player_id;
  Username username;
  std::string color;
  std::string shape;
  int score = 0;
  bool eliminated = false;
  bool connected = false;
  // 最后一次得分的逻辑序号，未得分为空
  std::optional<std::uint64_t> last_update;
};

/**
 * @brief 按排行规则原地排序
 *
 * 分数降序；同分时 last_update 较早者在前（未得分的排在有记录者之后）；
 * 仍相同则按 player_id 升序，保证结果全序且确定。
 */
void rankLeaderboard(std::vector<LeaderboardEntry>& entries);

/// @brief 前者是否排在后者之前
auto ranksBefore(const LeaderboardEntry& lhs, const LeaderboardEntry& rhs)
    -> bool;

// {player_id, username, color, shape, score, eliminated, connected}
auto toJson(const LeaderboardEntry& entry) -> nlohmann::json;
auto toJson(const std::vector<LeaderboardEntry>& entries) -> nlohmann::json;

}  // namespace mayhem::core
