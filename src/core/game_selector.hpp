#pragma once

#include <random>
#include <utility>
#include <vector>

#include "common/types.hpp"

namespace mayhem::core {

/**
 * @brief 候选游戏及其权重
 *
 * 排除最近两局出现过的游戏；若排除后为空，则只排除最近一局；
 * 仍为空则允许全部游戏。
 * 权重：从未玩过 2.0；历史至少3局且最近3局未出现 1.5；其余 1.0。
 *
 * @param history 已玩过的游戏编号，按时间顺序
 */
auto candidateWeights(const std::vector<GameNumber>& history)
    -> std::vector<std::pair<GameNumber, double>>;

/**
 * @brief 按权重随机选出下一局游戏，并追加到 history
 */
auto selectNextGame(std::vector<GameNumber>& history, std::mt19937& rng)
    -> GameNumber;

}  // namespace mayhem::core
