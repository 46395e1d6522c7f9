#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <tl/expected.hpp>
#include <unordered_map>
#include <vector>

#include "common/types.hpp"
#include "core/leaderboard.hpp"
#include "core/player.hpp"
#include "games/minigame.hpp"
#include "protocol/messages.hpp"

namespace mayhem::core {

class Tournament;

enum class LobbyErrorCode : std::uint8_t {
  LobbyFull,
  UsernameTaken,
  NotMember,
  NotHost,
  NotAllReady,
  TournamentInProgress,
  WrongGame
};

struct LobbyError {
  LobbyErrorCode code;
  std::string message;
};

template <typename T>
using LobbyResult = tl::expected<T, LobbyError>;

enum class JoinKind : std::uint8_t { Joined, Rejoined };

enum class TournamentPhase : std::uint8_t {
  Lobby,
  Preview,
  Running,
  RoundEnd,
  Finished
};

auto phaseName(TournamentPhase phase) -> const char*;

struct LobbySummary {
  LobbyCode id;
  Username host_name;
  std::size_t player_count = 0;
  int max_players = 0;
  bool is_full = false;
  bool in_game = false;
};

// {id, host_name, player_count, max_players, is_full, in_game}
auto toJson(const LobbySummary& summary) -> nlohmann::json;

struct AdvanceResult {
  std::vector<Username> advancing;
  std::vector<Username> eliminated;
};

/**
 * @brief 一局结束后的结算结果
 */
struct RoundOutcome {
  int round_number = 0;
  GameNumber game = 0;
  std::vector<LeaderboardEntry> advancing;
  std::vector<LeaderboardEntry> eliminated;
  bool terminal = false;
  // 非终局时已选出的下一局游戏
  GameNumber next_game = 0;
};

struct TournamentStanding {
  Username username;
  bool winner = false;
  int points = 0;
};

struct TournamentResult {
  std::optional<LeaderboardEntry> winner;
  std::vector<TournamentStanding> standings;
};

/**
 * @brief 大厅：玩家名单与锦标赛状态的聚合根
 *
 * 所有状态由同一把互斥锁保护，包括当前小游戏实例。
 * 广播在产生它的修改所持有的同一把锁内发出，
 * 因此客户端看到的事件顺序与状态变化顺序一致。
 *
 * 参赛记录以用户名为稳定句柄，连接ID只是记录上可替换的属性，
 * 重连只需重新绑定连接，积分与赛道位置随句柄保留。
 */
class Lobby {
 public:
  Lobby(LobbyCode code, Username host, int capacity);
  ~Lobby();

  Lobby(const Lobby&) = delete;
  auto operator=(const Lobby&) -> Lobby& = delete;

  [[nodiscard]] auto code() const -> const LobbyCode& { return code_; }
  [[nodiscard]] auto host() const -> const Username& { return host_; }
  [[nodiscard]] auto capacity() const -> int { return capacity_; }

  //--------------------------------------------------------------------------
  // 成员管理
  //--------------------------------------------------------------------------

  /**
   * @brief 加入大厅
   *
   * 名单已满时失败且不做任何修改。若同名参赛记录存在且其连接已断开，
   * 视为重连并恢复原有的锦标赛状态；若其连接仍在线则拒绝。
   */
  auto addPlayer(const std::shared_ptr<Player>& player)
      -> LobbyResult<JoinKind>;

  /**
   * @brief 离开大厅
   *
   * 参赛中的玩家保留其锦标赛记录以便重连。
   * @return 大厅是否已无在线成员
   */
  auto removePlayer(const ConnectionId& id) -> bool;

  auto hasMember(const ConnectionId& id) const -> bool;
  auto memberCount() const -> std::size_t;
  auto isEmpty() const -> bool;
  auto isFull() const -> bool;

  /// @brief 切换准备状态，返回新状态
  auto toggleReady(const ConnectionId& id) -> LobbyResult<bool>;
  auto allReady() const -> bool;

  /// @brief 在线成员列表（按加入顺序）
  auto roster() const -> nlohmann::json;
  void broadcastRoster();

  auto summary() const -> LobbySummary;

  /**
   * @brief 向所有在线成员广播
   *
   * 单个连接发送失败只记录日志，不影响其他成员。
   */
  void broadcast(const std::string& message,
                 const std::optional<ConnectionId>& exclude = std::nullopt);

  //--------------------------------------------------------------------------
  // 锦标赛
  //--------------------------------------------------------------------------

  /**
   * @brief 房主开始锦标赛
   *
   * @param skip_ready_check 测试模式下跳过全员准备检查
   */
  auto beginTournament(const Username& requester, bool skip_ready_check)
      -> LobbyResult<void>;

  /// @brief 按反重复权重选出下一局并记入历史
  auto selectNextGame(std::mt19937& rng) -> GameNumber;

  /// @brief 进入预告阶段并广播 GAME_PREVIEW，返回本局轮次
  auto announcePreview(GameNumber game) -> int;

  /**
   * @brief 重置参赛玩家的本局积分并启动小游戏
   * @return 本局的序号，每局递增
   */
  auto beginRound(std::unique_ptr<games::Minigame> game) -> std::uint64_t;

  /**
   * @brief 转发一名玩家的小游戏输入
   *
   * 没有进行中的局或玩家不在参赛名单时静默丢弃。
   * @return 本局已满足提前结束条件时返回其序号（在锁内读取），否则为空
   */
  auto submitInput(const ConnectionId& id, protocol::EventType type,
                   const nlohmann::json& body)
      -> LobbyResult<std::optional<std::uint64_t>>;

  auto isRoundComplete() -> bool;

  /**
   * @brief 结束本局：结算排行榜、晋级淘汰一次，并广播 ROUND_END
   *
   * 只有在局进行中时才生效，重复调用返回空。
   */
  auto finishRound(int max_rounds, std::mt19937& rng)
      -> std::optional<RoundOutcome>;

  /// @brief 广播冠军并进入结束状态
  auto finishTournament() -> TournamentResult;

  /**
   * @brief 按排行榜将前一半（向上取整）保留为参赛者，其余成为观众
   *
   * 每局只能调用一次。
   */
  auto advancePlayers() -> AdvanceResult;

  auto leaderboard() const -> std::vector<LeaderboardEntry>;

  /// @brief 奖励积分（同时刷新最后得分序号）
  void addScore(const Username& player, int delta);
  auto scoreOf(const Username& player) const -> int;

  auto phase() const -> TournamentPhase;
  auto roundNumber() const -> int;
  auto currentGame() const -> GameNumber;
  auto gameHistory() const -> std::vector<GameNumber>;
  auto activePlayers() const -> std::vector<Username>;
  auto spectators() const -> std::vector<Username>;
  auto inGame() const -> bool;

  void attachTournament(std::shared_ptr<Tournament> tournament);
  auto tournament() const -> std::shared_ptr<Tournament>;

 private:
  class Scope;

  struct Participant {
    std::shared_ptr<Player> player;  // 断线时为空
    std::string color = kDefaultPlayerColor;
    std::string shape = "circle";
    int score = 0;
    std::optional<std::uint64_t> last_update;
    int tournament_points = 0;
    std::uint64_t join_order = 0;
  };

  auto connectedCountNoLock() const -> std::size_t;
  auto isCompetingNoLock(const Username& player) const -> bool;
  auto inTournamentNoLock(const Username& player) const -> bool;
  auto inGameNoLock() const -> bool;
  auto orderedMembersNoLock() const -> std::vector<const Participant*>;
  auto leaderboardNoLock() const -> std::vector<LeaderboardEntry>;
  auto advancePlayersNoLock(const std::vector<LeaderboardEntry>& board)
      -> AdvanceResult;
  void touchNoLock(Participant& participant);
  void broadcastNoLock(const std::string& message,
                       const std::optional<ConnectionId>& exclude);
  auto rosterNoLock() const -> nlohmann::json;
  void broadcastRosterNoLock();

  static void sendSafely(const Player& player, const std::string& message);

  const LobbyCode code_;
  const Username host_;
  const int capacity_;

  mutable std::mutex mutex_;
  std::map<Username, Participant> participants_;
  std::unordered_map<ConnectionId, Username> connections_;
  std::uint64_t next_join_order_ = 0;

  TournamentPhase phase_ = TournamentPhase::Lobby;
  std::vector<Username> active_players_;
  std::vector<Username> spectators_;
  std::vector<GameNumber> game_history_;
  GameNumber current_game_ = 0;
  int round_number_ = 0;
  std::uint64_t round_serial_ = 0;
  std::uint64_t score_sequence_ = 0;
  std::unique_ptr<games::Minigame> game_;

  std::shared_ptr<Tournament> tournament_;
};

}  // namespace mayhem::core
