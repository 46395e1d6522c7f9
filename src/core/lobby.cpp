#include "lobby.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

#include "common/constants.hpp"
#include "common/logging.hpp"
#include "core/game_selector.hpp"
#include "games/game_catalog.hpp"

namespace mayhem::core {

//-----------------------------------------------------------------------------
// Scope: 在大厅锁内提供给小游戏的上下文
//-----------------------------------------------------------------------------

class Lobby::Scope final : public games::RoundContext {
 public:
  explicit Scope(Lobby& lobby) : lobby_(lobby) {}

  auto activePlayers() const -> std::vector<games::PlayerHandle> override {
    return lobby_.active_players_;
  }

  auto isCompeting(const games::PlayerHandle& player) const -> bool override {
    return lobby_.isCompetingNoLock(player);
  }

  auto score(const games::PlayerHandle& player) const -> int override {
    auto it = lobby_.participants_.find(player);
    return it == lobby_.participants_.end() ? 0 : it->second.score;
  }

  void addScore(const games::PlayerHandle& player, int delta) override {
    auto it = lobby_.participants_.find(player);
    if (it == lobby_.participants_.end()) {
      return;
    }
    it->second.score += delta;
    lobby_.touchNoLock(it->second);
  }

  void touch(const games::PlayerHandle& player) override {
    auto it = lobby_.participants_.find(player);
    if (it != lobby_.participants_.end()) {
      lobby_.touchNoLock(it->second);
    }
  }

  void sendTo(const games::PlayerHandle& player,
              const std::string& message) override {
    auto it = lobby_.participants_.find(player);
    if (it != lobby_.participants_.end() && it->second.player) {
      sendSafely(*it->second.player, message);
    }
  }

  void broadcast(const std::string& message) override {
    lobby_.broadcastNoLock(message, std::nullopt);
  }

  auto leaderboard() const -> std::vector<LeaderboardEntry> override {
    return lobby_.leaderboardNoLock();
  }

 private:
  Lobby& lobby_;
};

//-----------------------------------------------------------------------------

auto phaseName(TournamentPhase phase) -> const char* {
  switch (phase) {
    case TournamentPhase::Lobby:
      return "LOBBY";
    case TournamentPhase::Preview:
      return "PREVIEW";
    case TournamentPhase::Running:
      return "RUNNING";
    case TournamentPhase::RoundEnd:
      return "ROUND_END";
    case TournamentPhase::Finished:
      return "FINISHED";
  }
  return "UNKNOWN";
}

auto toJson(const LobbySummary& summary) -> nlohmann::json {
  return {{"id", summary.id},
          {"host_name", summary.host_name},
          {"player_count", summary.player_count},
          {"max_players", summary.max_players},
          {"is_full", summary.is_full},
          {"in_game", summary.in_game}};
}

Lobby::Lobby(LobbyCode code, Username host, int capacity)
    : code_(std::move(code)),
      host_(std::move(host)),
      capacity_(std::clamp(capacity, constants::kMinLobbyCapacity,
                           constants::kMaxLobbyCapacity)) {}

Lobby::~Lobby() = default;

//-----------------------------------------------------------------------------
// 成员管理
//-----------------------------------------------------------------------------

auto Lobby::addPlayer(const std::shared_ptr<Player>& player)
    -> LobbyResult<JoinKind> {
  std::lock_guard lock(mutex_);
  const auto username = player->username();

  auto it = participants_.find(username);
  if (it != participants_.end() && it->second.player) {
    auto& existing = it->second.player;
    if (existing == player) {
      return JoinKind::Joined;
    }
    if (existing->isConnected()) {
      return tl::make_unexpected(LobbyError{
          LobbyErrorCode::UsernameTaken,
          fmt::format("Username '{}' is already in this lobby", username)});
    }
    // 旧连接已关闭但尚未清理
    connections_.erase(existing->id());
    existing->setLobbyId(std::nullopt);
    existing.reset();
  }

  if (connectedCountNoLock() >= static_cast<std::size_t>(capacity_)) {
    return tl::make_unexpected(
        LobbyError{LobbyErrorCode::LobbyFull, "Lobby is full"});
  }

  JoinKind kind = JoinKind::Joined;
  if (it != participants_.end()) {
    kind = JoinKind::Rejoined;
  } else {
    it = participants_.emplace(username, Participant{}).first;
    it->second.join_order = next_join_order_++;
  }

  auto& participant = it->second;
  participant.player = player;
  participant.color = player->color();
  participant.shape = shapeToString(player->shape());
  connections_[player->id()] = username;

  player->setLobbyId(code_);
  player->setHost(username == host_);
  player->setReady(false);

  if (kind == JoinKind::Rejoined) {
    LOG_INFO << "Player " << username << " rejoined lobby " << code_
             << " (score " << participant.score << ")";
    if (game_ && game_->isActive() && isCompetingNoLock(username)) {
      Scope scope(*this);
      game_->rejoin(scope, username);
    }
  } else {
    LOG_INFO << "Player " << username << " joined lobby " << code_ << " ("
             << connectedCountNoLock() << "/" << capacity_ << ")";
  }
  return kind;
}

auto Lobby::removePlayer(const ConnectionId& id) -> bool {
  std::lock_guard lock(mutex_);
  auto conn_it = connections_.find(id);
  if (conn_it == connections_.end()) {
    return connectedCountNoLock() == 0;
  }

  const auto username = conn_it->second;
  connections_.erase(conn_it);

  auto it = participants_.find(username);
  if (it != participants_.end()) {
    auto& participant = it->second;
    if (participant.player && participant.player->id() == id) {
      participant.color = participant.player->color();
      participant.shape = shapeToString(participant.player->shape());
      participant.player->setLobbyId(std::nullopt);
      participant.player->setReady(false);
      participant.player->setHost(false);
      participant.player.reset();
    }
    if (!inTournamentNoLock(username)) {
      participants_.erase(it);
    }
  }

  LOG_INFO << "Player " << username << " left lobby " << code_ << " ("
           << connectedCountNoLock() << " remaining)";
  return connectedCountNoLock() == 0;
}

auto Lobby::hasMember(const ConnectionId& id) const -> bool {
  std::lock_guard lock(mutex_);
  return connections_.count(id) > 0;
}

auto Lobby::memberCount() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return connectedCountNoLock();
}

auto Lobby::isEmpty() const -> bool { return memberCount() == 0; }

auto Lobby::isFull() const -> bool {
  return memberCount() >= static_cast<std::size_t>(capacity_);
}

auto Lobby::toggleReady(const ConnectionId& id) -> LobbyResult<bool> {
  std::lock_guard lock(mutex_);
  auto conn_it = connections_.find(id);
  if (conn_it == connections_.end()) {
    return tl::make_unexpected(
        LobbyError{LobbyErrorCode::NotMember, "Not in this lobby"});
  }
  auto& player = participants_.at(conn_it->second).player;
  const bool ready = !player->isReady();
  player->setReady(ready);
  return ready;
}

auto Lobby::allReady() const -> bool {
  std::lock_guard lock(mutex_);
  return std::all_of(participants_.begin(), participants_.end(),
                     [](const auto& entry) {
                       const auto& player = entry.second.player;
                       return !player || player->isReady();
                     });
}

auto Lobby::roster() const -> nlohmann::json {
  std::lock_guard lock(mutex_);
  return rosterNoLock();
}

void Lobby::broadcastRoster() {
  std::lock_guard lock(mutex_);
  broadcastRosterNoLock();
}

auto Lobby::summary() const -> LobbySummary {
  std::lock_guard lock(mutex_);
  LobbySummary summary;
  summary.id = code_;
  summary.host_name = host_;
  summary.player_count = connectedCountNoLock();
  summary.max_players = capacity_;
  summary.is_full = summary.player_count >= static_cast<std::size_t>(capacity_);
  summary.in_game = inGameNoLock();
  return summary;
}

void Lobby::broadcast(const std::string& message,
                      const std::optional<ConnectionId>& exclude) {
  std::lock_guard lock(mutex_);
  broadcastNoLock(message, exclude);
}

//-----------------------------------------------------------------------------
// 锦标赛
//-----------------------------------------------------------------------------

auto Lobby::beginTournament(const Username& requester, bool skip_ready_check)
    -> LobbyResult<void> {
  std::lock_guard lock(mutex_);
  if (requester != host_) {
    return tl::make_unexpected(
        LobbyError{LobbyErrorCode::NotHost, "Only the host can start the game"});
  }
  if (inGameNoLock()) {
    return tl::make_unexpected(LobbyError{LobbyErrorCode::TournamentInProgress,
                                          "A tournament is already running"});
  }
  if (!skip_ready_check) {
    const bool all_ready =
        std::all_of(participants_.begin(), participants_.end(),
                    [](const auto& entry) {
                      const auto& player = entry.second.player;
                      return !player || player->isReady();
                    });
    if (!all_ready) {
      return tl::make_unexpected(
          LobbyError{LobbyErrorCode::NotAllReady, "Not all players are ready"});
    }
  }

  // 上一届留下的断线记录不再需要
  for (auto it = participants_.begin(); it != participants_.end();) {
    if (!it->second.player) {
      it = participants_.erase(it);
    } else {
      ++it;
    }
  }

  active_players_.clear();
  spectators_.clear();
  for (const auto* participant : orderedMembersNoLock()) {
    active_players_.push_back(participant->player->username());
  }
  for (auto& [username, participant] : participants_) {
    participant.score = 0;
    participant.last_update.reset();
    participant.tournament_points = 0;
  }

  round_number_ = 0;
  current_game_ = constants::kNoGame;
  phase_ = TournamentPhase::Preview;
  LOG_INFO << "Lobby " << code_ << " started a tournament with "
           << active_players_.size() << " players";
  return {};
}

auto Lobby::selectNextGame(std::mt19937& rng) -> GameNumber {
  std::lock_guard lock(mutex_);
  return core::selectNextGame(game_history_, rng);
}

auto Lobby::announcePreview(GameNumber game) -> int {
  std::lock_guard lock(mutex_);
  ++round_number_;
  phase_ = TournamentPhase::Preview;

  nlohmann::json info = nullptr;
  if (auto details = games::gameInfo(game)) {
    info = games::toJson(*details);
  }
  broadcastNoLock(protocol::encodeEvent(protocol::outbound::kGamePreview,
                                        {{"game_number", game},
                                         {"game_info", info},
                                         {"round_number", round_number_}}),
                  std::nullopt);
  LOG_INFO << "Lobby " << code_ << " round " << round_number_
           << " preview: game " << game;
  return round_number_;
}

auto Lobby::beginRound(std::unique_ptr<games::Minigame> game)
    -> std::uint64_t {
  std::lock_guard lock(mutex_);
  ++round_serial_;
  for (const auto& handle : active_players_) {
    auto it = participants_.find(handle);
    if (it != participants_.end()) {
      it->second.score = 0;
      it->second.last_update.reset();
    }
  }

  current_game_ = game->gameNumber();
  game_ = std::move(game);
  phase_ = TournamentPhase::Running;

  Scope scope(*this);
  game_->begin(scope);
  LOG_INFO << "Lobby " << code_ << " round " << round_number_ << " running game "
           << current_game_ << " with " << active_players_.size()
           << " players";
  return round_serial_;
}

auto Lobby::submitInput(const ConnectionId& id, protocol::EventType type,
                        const nlohmann::json& body)
    -> LobbyResult<std::optional<std::uint64_t>> {
  std::lock_guard lock(mutex_);
  auto conn_it = connections_.find(id);
  if (conn_it == connections_.end()) {
    return tl::make_unexpected(
        LobbyError{LobbyErrorCode::NotMember, "Not in this lobby"});
  }
  if (!game_ || !game_->isActive()) {
    return std::nullopt;
  }
  if (!game_->acceptsInput(type)) {
    return tl::make_unexpected(LobbyError{
        LobbyErrorCode::WrongGame,
        fmt::format("{} is not valid during game {}",
                    protocol::eventTypeName(type), current_game_)});
  }

  const auto& handle = conn_it->second;
  if (!isCompetingNoLock(handle)) {
    return std::nullopt;
  }

  Scope scope(*this);
  game_->submit(scope, handle, body);
  if (!game_->isComplete(scope)) {
    return std::nullopt;
  }
  return round_serial_;
}

auto Lobby::isRoundComplete() -> bool {
  std::lock_guard lock(mutex_);
  if (!game_ || !game_->isActive()) {
    return false;
  }
  Scope scope(*this);
  return game_->isComplete(scope);
}

auto Lobby::finishRound(int max_rounds, std::mt19937& rng)
    -> std::optional<RoundOutcome> {
  std::lock_guard lock(mutex_);
  if (phase_ != TournamentPhase::Running || !game_) {
    return std::nullopt;
  }

  game_->finish();
  const auto board = leaderboardNoLock();
  for (const auto& handle : active_players_) {
    auto it = participants_.find(handle);
    if (it != participants_.end()) {
      it->second.tournament_points += it->second.score;
    }
  }

  const auto result = advancePlayersNoLock(board);

  RoundOutcome outcome;
  outcome.round_number = round_number_;
  outcome.game = current_game_;
  for (const auto& entry : board) {
    if (std::find(result.advancing.begin(), result.advancing.end(),
                  entry.player_id) != result.advancing.end()) {
      outcome.advancing.push_back(entry);
    } else if (std::find(result.eliminated.begin(), result.eliminated.end(),
                         entry.player_id) != result.eliminated.end()) {
      auto eliminated = entry;
      eliminated.eliminated = true;
      outcome.eliminated.push_back(std::move(eliminated));
    }
  }

  game_.reset();
  current_game_ = constants::kNoGame;
  phase_ = TournamentPhase::RoundEnd;

  outcome.terminal =
      round_number_ >= max_rounds || active_players_.size() <= 1;
  nlohmann::json next_game = nullptr;
  nlohmann::json next_game_info = nullptr;
  if (!outcome.terminal) {
    outcome.next_game = core::selectNextGame(game_history_, rng);
    next_game = outcome.next_game;
    if (auto details = games::gameInfo(outcome.next_game)) {
      next_game_info = games::toJson(*details);
    }
  }

  broadcastNoLock(
      protocol::encodeEvent(protocol::outbound::kRoundEnd,
                            {{"round_number", outcome.round_number},
                             {"game_number", outcome.game},
                             {"advancing", toJson(outcome.advancing)},
                             {"eliminated", toJson(outcome.eliminated)},
                             {"next_game", next_game},
                             {"next_game_info", next_game_info}}),
      std::nullopt);

  LOG_INFO << "Lobby " << code_ << " round " << outcome.round_number
           << " ended: " << outcome.advancing.size() << " advancing, "
           << outcome.eliminated.size() << " eliminated"
           << (outcome.terminal ? " (final)" : "");
  return outcome;
}

auto Lobby::finishTournament() -> TournamentResult {
  std::lock_guard lock(mutex_);
  TournamentResult result;

  const auto board = leaderboardNoLock();
  for (const auto& entry : board) {
    if (!entry.eliminated) {
      result.winner = entry;
      break;
    }
  }

  for (const auto& entry : board) {
    TournamentStanding standing;
    standing.username = entry.player_id;
    standing.winner =
        result.winner && result.winner->player_id == entry.player_id;
    auto it = participants_.find(entry.player_id);
    standing.points =
        it == participants_.end() ? 0 : it->second.tournament_points;
    result.standings.push_back(std::move(standing));
  }

  phase_ = TournamentPhase::Finished;
  for (auto& [username, participant] : participants_) {
    if (participant.player) {
      participant.player->setReady(false);
    }
  }

  const std::string winner_name =
      result.winner ? result.winner->username : "no one";
  broadcastNoLock(
      protocol::encodeEvent(
          protocol::outbound::kTournamentWinner,
          {{"winner", winner_name},
           {"winner_entry",
            result.winner ? toJson(*result.winner) : nlohmann::json(nullptr)},
           {"leaderboard", toJson(board)}}),
      std::nullopt);
  broadcastRosterNoLock();

  LOG_INFO << "Lobby " << code_ << " tournament finished, winner: "
           << winner_name;
  return result;
}

auto Lobby::advancePlayers() -> AdvanceResult {
  std::lock_guard lock(mutex_);
  return advancePlayersNoLock(leaderboardNoLock());
}

auto Lobby::leaderboard() const -> std::vector<LeaderboardEntry> {
  std::lock_guard lock(mutex_);
  return leaderboardNoLock();
}

void Lobby::addScore(const Username& player, int delta) {
  std::lock_guard lock(mutex_);
  auto it = participants_.find(player);
  if (it == participants_.end()) {
    return;
  }
  it->second.score += delta;
  touchNoLock(it->second);
}

auto Lobby::scoreOf(const Username& player) const -> int {
  std::lock_guard lock(mutex_);
  auto it = participants_.find(player);
  return it == participants_.end() ? 0 : it->second.score;
}

auto Lobby::phase() const -> TournamentPhase {
  std::lock_guard lock(mutex_);
  return phase_;
}

auto Lobby::roundNumber() const -> int {
  std::lock_guard lock(mutex_);
  return round_number_;
}

auto Lobby::currentGame() const -> GameNumber {
  std::lock_guard lock(mutex_);
  return current_game_;
}

auto Lobby::gameHistory() const -> std::vector<GameNumber> {
  std::lock_guard lock(mutex_);
  return game_history_;
}

auto Lobby::activePlayers() const -> std::vector<Username> {
  std::lock_guard lock(mutex_);
  return active_players_;
}

auto Lobby::spectators() const -> std::vector<Username> {
  std::lock_guard lock(mutex_);
  return spectators_;
}

auto Lobby::inGame() const -> bool {
  std::lock_guard lock(mutex_);
  return inGameNoLock();
}

void Lobby::attachTournament(std::shared_ptr<Tournament> tournament) {
  std::lock_guard lock(mutex_);
  tournament_ = std::move(tournament);
}

auto Lobby::tournament() const -> std::shared_ptr<Tournament> {
  std::lock_guard lock(mutex_);
  return tournament_;
}

//-----------------------------------------------------------------------------
// 内部实现（调用者已持有 mutex_）
//-----------------------------------------------------------------------------

auto Lobby::connectedCountNoLock() const -> std::size_t {
  return connections_.size();
}

auto Lobby::isCompetingNoLock(const Username& player) const -> bool {
  return std::find(active_players_.begin(), active_players_.end(), player) !=
         active_players_.end();
}

auto Lobby::inTournamentNoLock(const Username& player) const -> bool {
  return isCompetingNoLock(player) ||
         std::find(spectators_.begin(), spectators_.end(), player) !=
             spectators_.end();
}

auto Lobby::inGameNoLock() const -> bool {
  return phase_ == TournamentPhase::Preview ||
         phase_ == TournamentPhase::Running ||
         phase_ == TournamentPhase::RoundEnd;
}

auto Lobby::orderedMembersNoLock() const -> std::vector<const Participant*> {
  std::vector<const Participant*> members;
  for (const auto& [username, participant] : participants_) {
    if (participant.player) {
      members.push_back(&participant);
    }
  }
  std::sort(members.begin(), members.end(),
            [](const Participant* lhs, const Participant* rhs) {
              return lhs->join_order < rhs->join_order;
            });
  return members;
}

auto Lobby::leaderboardNoLock() const -> std::vector<LeaderboardEntry> {
  std::vector<LeaderboardEntry> entries;

  auto append = [&](const Username& handle, bool eliminated) {
    auto it = participants_.find(handle);
    if (it == participants_.end()) {
      return;
    }
    const auto& participant = it->second;

    LeaderboardEntry entry;
    entry.player_id = handle;
    entry.username = handle;
    entry.eliminated = eliminated;
    entry.connected = participant.player != nullptr;
    entry.color = participant.player ? participant.player->color()
                                     : participant.color;
    entry.shape = participant.player
                      ? shapeToString(participant.player->shape())
                      : participant.shape;
    entry.score = participant.score;
    if (!eliminated && game_) {
      entry.score = game_->currentScore(handle).value_or(participant.score);
    }
    entry.last_update = participant.last_update;
    entries.push_back(std::move(entry));
  };

  for (const auto& handle : active_players_) {
    append(handle, false);
  }
  for (const auto& handle : spectators_) {
    append(handle, true);
  }

  rankLeaderboard(entries);
  return entries;
}

auto Lobby::advancePlayersNoLock(const std::vector<LeaderboardEntry>& board)
    -> AdvanceResult {
  AdvanceResult result;
  std::vector<Username> ranked;
  for (const auto& entry : board) {
    if (!entry.eliminated) {
      ranked.push_back(entry.player_id);
    }
  }

  if (ranked.size() <= 1) {
    result.advancing = active_players_;
    return result;
  }

  const auto cut = (ranked.size() + 1) / 2;
  result.advancing.assign(ranked.begin(),
                          ranked.begin() + static_cast<std::ptrdiff_t>(cut));
  result.eliminated.assign(ranked.begin() + static_cast<std::ptrdiff_t>(cut),
                           ranked.end());

  active_players_ = result.advancing;
  spectators_.insert(spectators_.end(), result.eliminated.begin(),
                     result.eliminated.end());
  return result;
}

void Lobby::touchNoLock(Participant& participant) {
  participant.last_update = ++score_sequence_;
}

void Lobby::broadcastNoLock(const std::string& message,
                            const std::optional<ConnectionId>& exclude) {
  for (const auto& [username, participant] : participants_) {
    if (!participant.player) {
      continue;
    }
    if (exclude && participant.player->id() == *exclude) {
      continue;
    }
    sendSafely(*participant.player, message);
  }
}

auto Lobby::rosterNoLock() const -> nlohmann::json {
  auto players = nlohmann::json::array();
  for (const auto* participant : orderedMembersNoLock()) {
    players.push_back(participant->player->toJson());
  }
  return players;
}

void Lobby::broadcastRosterNoLock() {
  broadcastNoLock(protocol::encodeEvent(protocol::outbound::kRosterUpdate,
                                        {{"players", rosterNoLock()}}),
                  std::nullopt);
}

void Lobby::sendSafely(const Player& player, const std::string& message) {
  try {
    player.send(message);
  } catch (const std::exception& e) {
    LOG_WARNING << "Failed to send to " << player.username() << ": "
                << e.what();
  }
}

}  // namespace mayhem::core
