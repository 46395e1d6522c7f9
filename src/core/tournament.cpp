#include "tournament.hpp"

#include <utility>

#include "common/logging.hpp"

namespace mayhem::core {

Tournament::Tournament(const net::any_io_executor& executor,
                       std::weak_ptr<Lobby> lobby, TournamentConfig config,
                       games::MinigameFactory factory,
                       std::shared_ptr<storage::ProfileStore> profiles,
                       std::uint32_t seed)
    : strand_(net::make_strand(executor)),
      timer_(strand_),
      lobby_(std::move(lobby)),
      config_(std::move(config)),
      factory_(std::move(factory)),
      profiles_(std::move(profiles)),
      rng_(seed) {}

auto Tournament::start(const Username& requester, bool test_mode)
    -> LobbyResult<void> {
  auto lobby = lobby_.lock();
  if (!lobby) {
    return tl::make_unexpected(
        LobbyError{LobbyErrorCode::NotMember, "Lobby no longer exists"});
  }

  const bool skip_ready_check = test_mode && config_.allow_test_mode;
  if (test_mode && !config_.allow_test_mode) {
    LOG_WARNING << "Ignoring test_mode from " << requester
                << ": test mode is disabled";
  }

  auto started = lobby->beginTournament(requester, skip_ready_check);
  if (!started) {
    return started;
  }

  cancelled_ = false;
  net::post(strand_, [self = shared_from_this()] {
    auto lobby = self->lobby_.lock();
    if (!lobby || self->cancelled_) {
      return;
    }
    self->runPreview(lobby->selectNextGame(self->rng_));
  });
  return {};
}

auto Tournament::submitInput(const ConnectionId& id, protocol::EventType type,
                             const nlohmann::json& body) -> LobbyResult<void> {
  auto lobby = lobby_.lock();
  if (!lobby) {
    return tl::make_unexpected(
        LobbyError{LobbyErrorCode::NotMember, "Lobby no longer exists"});
  }

  auto complete = lobby->submitInput(id, type, body);
  if (!complete) {
    return tl::make_unexpected(complete.error());
  }

  if (const auto serial = *complete) {
    net::post(strand_, [self = shared_from_this(), serial = *serial] {
      self->endRound(serial);
    });
  }
  return {};
}

void Tournament::cancel() {
  cancelled_ = true;
  net::post(strand_, [self = shared_from_this()] { self->timer_.cancel(); });
}

void Tournament::schedule(std::chrono::milliseconds delay,
                          std::function<void()> step) {
  timer_.expires_after(delay);
  timer_.async_wait([self = shared_from_this(),
                     step = std::move(step)](const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted || self->cancelled_) {
      return;
    }
    if (ec) {
      LOG_ERROR << "Tournament timer failed: " << ec.message();
      return;
    }
    step();
  });
}

void Tournament::runPreview(GameNumber game) {
  auto lobby = lobby_.lock();
  if (!lobby || cancelled_) {
    return;
  }

  lobby->announcePreview(game);
  schedule(config_.preview_delay, [this, game] { runRound(game); });
}

void Tournament::runRound(GameNumber game) {
  auto lobby = lobby_.lock();
  if (!lobby || cancelled_) {
    return;
  }

  std::unique_ptr<games::Minigame> minigame;
  try {
    minigame = factory_(game);
  } catch (const std::exception& e) {
    LOG_ERROR << "Cannot create game " << game << " for lobby "
              << lobby->code() << ": " << e.what();
    completeTournament(*lobby);
    return;
  }

  const auto duration = minigame->duration();
  const auto serial = lobby->beginRound(std::move(minigame));
  round_serial_ = serial;

  if (lobby->isRoundComplete()) {
    endRound(serial);
    return;
  }
  schedule(duration, [this, serial] { endRound(serial); });
}

void Tournament::endRound(std::uint64_t serial) {
  if (serial != round_serial_ || cancelled_) {
    return;
  }
  auto lobby = lobby_.lock();
  if (!lobby) {
    return;
  }

  auto outcome = lobby->finishRound(config_.max_rounds, rng_);
  if (!outcome) {
    // 本局已由另一路径结算
    return;
  }
  timer_.cancel();

  if (outcome->terminal) {
    completeTournament(*lobby);
    return;
  }

  const auto next_game = outcome->next_game;
  schedule(config_.intermission_delay,
           [this, next_game] { runPreview(next_game); });
}

void Tournament::completeTournament(Lobby& lobby) {
  auto result = lobby.finishTournament();
  recordStatistics(result);
}

void Tournament::recordStatistics(const TournamentResult& result) {
  if (!profiles_) {
    return;
  }

  for (const auto& standing : result.standings) {
    auto profile = profiles_->getProfile(standing.username)
                       .value_or(storage::makeDefaultProfile(standing.username));
    profile.set_total_games(profile.total_games() + 1);
    if (standing.winner) {
      profile.set_wins(profile.wins() + 1);
    } else {
      profile.set_losses(profile.losses() + 1);
    }
    profile.set_total_points(profile.total_points() + standing.points);

    if (auto stored = profiles_->updateProfile(profile); !stored) {
      LOG_ERROR << "Failed to record statistics for " << standing.username
                << ": " << stored.error().message;
    }
  }
}

}  // namespace mayhem::core
