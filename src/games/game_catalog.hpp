#pragma once

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "common/types.hpp"
#include "core/tournament_config.hpp"
#include "games/minigame.hpp"

namespace mayhem::games {

/**
 * @brief 预告阶段展示给客户端的游戏信息
 */
struct GameInfo {
  GameNumber number = 0;
  std::string name;
  std::string description;
};

auto gameInfo(GameNumber game) -> std::optional<GameInfo>;

// {number, name, description}
auto toJson(const GameInfo& info) -> nlohmann::json;

/// 每局按游戏编号新建一个小游戏实例
using MinigameFactory = std::function<std::unique_ptr<Minigame>(GameNumber)>;

/**
 * @brief 以给定配置创建小游戏工厂
 *
 * 工厂对未知编号抛出 std::invalid_argument。
 */
auto makeMinigameFactory(const core::TournamentConfig& config)
    -> MinigameFactory;

}  // namespace mayhem::games
