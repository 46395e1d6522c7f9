#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include "common/types.hpp"

namespace mayhem::constants {

//-----------------------------------------------------------------------------
// 服务配置 (Service Configuration)
//-----------------------------------------------------------------------------

/// @brief WebSocket / REST 服务默认端口
constexpr uint16_t kDefaultServicePort = 8000;

/// @brief 默认IO线程数
constexpr int kDefaultThreadCount = 4;

/// @brief 最大IO线程数
constexpr int kMaxThreadCount = 16;

/// @brief 最大消息大小 (64KB)
constexpr std::size_t kMaxMessageSize = 64 * 1024;

/// @brief 单个连接的最大待发送消息数
constexpr std::size_t kMaxMessageQueueSize = 256;

/// @brief 握手超时时间
constexpr auto kDefaultHandshakeTimeout = std::chrono::milliseconds(5000);

//-----------------------------------------------------------------------------
// 大厅 (Lobby)
//-----------------------------------------------------------------------------

constexpr int kMinLobbyCapacity = 5;
constexpr int kMaxLobbyCapacity = 50;
constexpr int kDefaultLobbyCapacity = 10;

/// @brief 大厅代码长度（便于手动输入）
constexpr std::size_t kLobbyCodeLength = 6;

/// @brief 用户名最大长度
constexpr std::size_t kMaxUsernameLength = 32;

//-----------------------------------------------------------------------------
// 锦标赛 (Tournament)
//-----------------------------------------------------------------------------

/// @brief 无游戏进行中
constexpr GameNumber kNoGame = 0;

constexpr GameNumber kMathQuizGame = 1;
constexpr GameNumber kSpeedTypingGame = 2;
constexpr GameNumber kTriviaRaceGame = 3;

constexpr std::array<GameNumber, 3> kAllGames = {
    kMathQuizGame, kSpeedTypingGame, kTriviaRaceGame};

/// @brief 淘汰轮数上限
constexpr int kDefaultMaxRounds = 3;

constexpr auto kDefaultPreviewDelay = std::chrono::milliseconds(5000);
constexpr auto kDefaultIntermissionDelay = std::chrono::milliseconds(5000);

//-----------------------------------------------------------------------------
// 选游戏权重 (Game Selection)
//-----------------------------------------------------------------------------

/// @brief 最近多少局内出现过的游戏被排除
constexpr std::size_t kRecentExclusionWindow = 2;

/// @brief “近期未玩”判定窗口
constexpr std::size_t kRecencyWindow = 3;

constexpr double kUnplayedGameWeight = 2.0;
constexpr double kNotRecentGameWeight = 1.5;
constexpr double kBaseGameWeight = 1.0;

//-----------------------------------------------------------------------------
// 小游戏 (Minigames)
//-----------------------------------------------------------------------------

constexpr auto kMathQuizDuration = std::chrono::milliseconds(20000);
constexpr int kMathOperandMin = 1;
constexpr int kMathOperandMax = 20;

constexpr auto kSpeedTypingDuration = std::chrono::milliseconds(30000);
constexpr std::size_t kDefaultWordCount = 50;

constexpr auto kTriviaRaceDuration = std::chrono::milliseconds(90000);
constexpr int kTriviaFinishLine = 10;

/// @brief 终点名次奖励：第1/2/3名，其余
constexpr std::array<int, 4> kFinishBonusSchedule = {50, 30, 15, 5};

}  // namespace mayhem::constants
