#include "lobby_directory.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

#include "common/logging.hpp"
#include "core/tournament.hpp"

namespace mayhem::core {

LobbyDirectory::LobbyDirectory(boost::asio::any_io_executor executor,
                               TournamentConfig config,
                               games::MinigameFactory factory,
                               std::shared_ptr<storage::ProfileStore> profiles)
    : executor_(std::move(executor)),
      config_(std::move(config)),
      factory_(std::move(factory)),
      profiles_(std::move(profiles)),
      rng_(std::random_device{}()) {}

LobbyDirectory::~LobbyDirectory() {
  std::lock_guard lock(mutex_);
  for (auto& [code, lobby] : lobbies_) {
    if (auto tournament = lobby->tournament()) {
      tournament->cancel();
    }
  }
}

auto LobbyDirectory::createLobby(const std::shared_ptr<Player>& host,
                                 int capacity)
    -> LobbyResult<std::shared_ptr<Lobby>> {
  std::shared_ptr<Lobby> lobby;
  {
    std::lock_guard lock(mutex_);
    auto code = generateCodeNoLock();
    lobby = std::make_shared<Lobby>(code, host->username(), capacity);
    lobby->attachTournament(std::make_shared<Tournament>(
        executor_, lobby, config_, factory_, profiles_));
    lobbies_.emplace(code, lobby);
  }

  auto joined = lobby->addPlayer(host);
  if (!joined) {
    removeLobby(lobby->code());
    return tl::make_unexpected(joined.error());
  }

  LOG_INFO << "Lobby " << lobby->code() << " created by " << host->username()
           << " (capacity " << lobby->capacity() << ")";
  return lobby;
}

auto LobbyDirectory::getLobby(const LobbyCode& code) const
    -> std::shared_ptr<Lobby> {
  std::lock_guard lock(mutex_);
  auto it = lobbies_.find(code);
  if (it != lobbies_.end()) {
    return it->second;
  }
  return nullptr;
}

void LobbyDirectory::removeLobby(const LobbyCode& code) {
  std::shared_ptr<Lobby> removed;
  {
    std::lock_guard lock(mutex_);
    auto it = lobbies_.find(code);
    if (it == lobbies_.end()) {
      return;
    }
    removed = std::move(it->second);
    lobbies_.erase(it);
  }

  if (auto tournament = removed->tournament()) {
    tournament->cancel();
  }
  LOG_INFO << "Lobby " << code << " destroyed";
}

auto LobbyDirectory::listSummaries() const -> std::vector<LobbySummary> {
  std::vector<std::shared_ptr<Lobby>> lobbies;
  {
    std::lock_guard lock(mutex_);
    lobbies.reserve(lobbies_.size());
    for (const auto& [code, lobby] : lobbies_) {
      lobbies.push_back(lobby);
    }
  }

  std::vector<LobbySummary> summaries;
  summaries.reserve(lobbies.size());
  for (const auto& lobby : lobbies) {
    summaries.push_back(lobby->summary());
  }
  std::sort(summaries.begin(), summaries.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.id < rhs.id; });
  return summaries;
}

auto LobbyDirectory::lobbyCount() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return lobbies_.size();
}

// 调用者已持有 mutex_
auto LobbyDirectory::generateCodeNoLock() -> LobbyCode {
  std::uniform_int_distribution<std::uint32_t> pick(0, 0xFFFFFF);
  LobbyCode code;
  do {
    code = fmt::format("{:06X}", pick(rng_));
  } while (lobbies_.count(code) > 0);
  return code;
}

}  // namespace mayhem::core
