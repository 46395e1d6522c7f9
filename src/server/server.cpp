#include "server.hpp"

#include <stdexcept>

#include "auth/identity_provider.hpp"
#include "common/config_manager.hpp"
#include "common/constants.hpp"
#include "common/logging.hpp"
#include "core/tournament_config.hpp"
#include "games/game_catalog.hpp"
#include "network/game_service.hpp"
#include "network/websocket_server.hpp"
#include "storage/profile_store.hpp"

namespace mayhem::server {

namespace {

auto openProfileStore(const common::ConfigManager& config)
    -> std::shared_ptr<storage::ProfileStore> {
  auto path = config.getString("profiles.path");
  if (!path || path->empty()) {
    LOG_INFO << "Using in-memory profile store";
    return std::make_shared<storage::InMemoryProfileStore>();
  }

  auto store = storage::FileProfileStore::open(*path);
  if (!store) {
    throw std::runtime_error(store.error().message);
  }
  LOG_INFO << "Using profile store at " << *path;
  return std::move(*store);
}

}  // namespace

Server::Server(const common::ConfigManager& config)
    : address_(config.getWithDefault("server.host", std::string("0.0.0.0"))),
      port_(config.getServicePort()),
      thread_count_(config.getWithDefault("server.threads",
                                          constants::kDefaultThreadCount)) {
  ioc_ = std::make_unique<net::io_context>();
  profiles_ = openProfileStore(config);

  auto token = config.getString("auth.token");
  identity_ = std::make_unique<auth::TokenIdentityProvider>(
      token ? std::optional<std::string>(*token) : std::nullopt);

  auto tournament = core::TournamentConfig::loadFrom(config);
  auto factory = games::makeMinigameFactory(tournament);
  service_ = std::make_unique<network::GameService>(
      ioc_->get_executor(), tournament, std::move(factory), profiles_);
  ws_server_ =
      std::make_unique<network::WebsocketServer>(*ioc_, *service_, *identity_);
}

Server::~Server() { stop(); }

void Server::start() {
  ws_server_->start(address_, port_, thread_count_);
  LOG_INFO << "Server started - WebSocket and REST on port "
           << ws_server_->port();
}

void Server::stop() {
  if (ws_server_ && ws_server_->isRunning()) {
    ws_server_->stop();
    LOG_INFO << "Server stopped.";
  }
}

auto Server::port() const -> Port { return ws_server_->port(); }

auto Server::service() -> network::GameService& { return *service_; }

}  // namespace mayhem::server
