#include "connection_registry.hpp"

#include <fmt/format.h>

#include <random>

#include "common/logging.hpp"

namespace mayhem::core {

namespace {

auto randomSalt() -> std::uint32_t {
  std::random_device rd;
  return rd();
}

}  // namespace

ConnectionRegistry::ConnectionRegistry() : instance_salt_(randomSalt()) {}

ConnectionRegistry::~ConnectionRegistry() = default;

auto ConnectionRegistry::registerConnection(
    const std::shared_ptr<MessageSink>& sink, const Username& username)
    -> std::shared_ptr<Player> {
  std::lock_guard lock(mutex_);
  auto id = nextConnectionId();
  auto player = std::make_shared<Player>(id, username, sink);
  players_.emplace(id, player);
  LOG_DEBUG << "Registered connection " << id << " for " << username
            << ". Total connections: " << players_.size();
  return player;
}

auto ConnectionRegistry::unregister(const ConnectionId& id)
    -> std::shared_ptr<Player> {
  std::lock_guard lock(mutex_);
  auto it = players_.find(id);
  if (it == players_.end()) {
    return nullptr;
  }
  auto player = std::move(it->second);
  players_.erase(it);
  LOG_DEBUG << "Unregistered connection " << id
            << ". Total connections: " << players_.size();
  return player;
}

auto ConnectionRegistry::getPlayer(const ConnectionId& id) const
    -> std::shared_ptr<Player> {
  std::lock_guard lock(mutex_);
  auto it = players_.find(id);
  if (it != players_.end()) {
    return it->second;
  }
  return nullptr;
}

auto ConnectionRegistry::getAllPlayers() const
    -> std::vector<std::shared_ptr<Player>> {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Player>> players;
  players.reserve(players_.size());
  for (const auto& [id, player] : players_) {
    players.push_back(player);
  }
  return players;
}

auto ConnectionRegistry::getConnectionCount() const -> size_t {
  std::lock_guard lock(mutex_);
  return players_.size();
}

// 调用者已持有 mutex_
auto ConnectionRegistry::nextConnectionId() -> ConnectionId {
  return fmt::format("{:08x}-{:06d}", instance_salt_, next_sequence_++);
}

}  // namespace mayhem::core
