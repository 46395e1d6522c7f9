#include "game_service.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <utility>

#include "auth/identity_provider.hpp"
#include "common/constants.hpp"
#include "common/logging.hpp"
#include "core/tournament.hpp"

namespace mayhem::network {

using protocol::EventType;

GameService::GameService(boost::asio::any_io_executor executor,
                         core::TournamentConfig config,
                         games::MinigameFactory factory,
                         std::shared_ptr<storage::ProfileStore> profiles)
    : directory_(std::move(executor), std::move(config), std::move(factory),
                 profiles),
      profiles_(std::move(profiles)) {}

auto GameService::onConnectionOpened(
    const std::shared_ptr<core::MessageSink>& sink, const Username& username)
    -> std::shared_ptr<core::Player> {
  auto player = registry_.registerConnection(sink, username);

  nlohmann::json stats = nlohmann::json::object();
  if (profiles_) {
    if (auto profile = profiles_->getProfile(username)) {
      auto shape = core::parseShape(profile->shape());
      player->updateProfile(
          profile->color().empty() ? player->color() : profile->color(),
          shape.value_or(player->shape()));
      stats = {{"wins", profile->wins()},
               {"losses", profile->losses()},
               {"total_games", profile->total_games()},
               {"total_points", profile->total_points()}};
    }
  }

  player->send(protocol::encodeEvent(protocol::outbound::kConnected,
                                     {{"player_id", player->id()},
                                      {"username", username},
                                      {"profile", player->toJson()},
                                      {"stats", stats}}));
  LOG_INFO << "Player " << username << " connected as " << player->id();
  return player;
}

void GameService::onConnectionClosed(const ConnectionId& id) {
  auto player = registry_.unregister(id);
  if (!player) {
    return;
  }
  leaveCurrentLobby(player);
  LOG_INFO << "Player " << player->username() << " (" << id
           << ") disconnected";
}

void GameService::processMessage(const ConnectionId& id,
                                 const std::string& raw_message) {
  auto player = registry_.getPlayer(id);
  if (!player) {
    LOG_WARNING << "Message from unknown connection " << id;
    return;
  }

  try {
    auto event = protocol::decodeClientEvent(raw_message);
    if (!event) {
      LOG_DEBUG << "Rejected message from " << player->username() << ": "
                << event.error().message;
      replyError(*player, event.error().message);
      return;
    }
    dispatch(player, *event);
  } catch (const std::exception& e) {
    LOG_ERROR << "Error processing message from " << player->username()
              << ": " << e.what();
    try {
      replyError(*player, fmt::format("Internal error: {}", e.what()));
    } catch (const std::exception& send_error) {
      LOG_WARNING << "Cannot report error to " << player->username() << ": "
                  << send_error.what();
    }
  }
}

auto GameService::lobbyListing() const -> nlohmann::json {
  auto lobbies = nlohmann::json::array();
  for (const auto& summary : directory_.listSummaries()) {
    lobbies.push_back(core::toJson(summary));
  }
  return lobbies;
}

void GameService::dispatch(const PlayerPtr& player,
                           const protocol::ClientEvent& event) {
  switch (event.type) {
    case EventType::CreateLobby:
      handleCreateLobby(player, event.body);
      break;
    case EventType::JoinLobby:
      handleJoinLobby(player, event.body);
      break;
    case EventType::UpdateProfile:
      handleUpdateProfile(player, event.body);
      break;
    case EventType::ToggleReady:
      handleToggleReady(player);
      break;
    case EventType::LeaveLobby:
      handleLeaveLobby(player);
      break;
    case EventType::StartGame:
      handleStartGame(player, event.body);
      break;
    case EventType::SubmitAnswer:
    case EventType::SubmitWord:
    case EventType::SubmitRaceAnswer:
      handleGameInput(player, event);
      break;
    case EventType::ListLobbies:
      handleListLobbies(player);
      break;
  }
}

//------------------------------------------------------------------------------
// 大厅事件

void GameService::handleCreateLobby(const PlayerPtr& player,
                                    const nlohmann::json& body) {
  if (player->lobbyId()) {
    replyError(*player, "Leave your current lobby first");
    return;
  }

  const int capacity = protocol::readInt(body, "capacity")
                           .value_or(constants::kDefaultLobbyCapacity);
  auto created = directory_.createLobby(player, capacity);
  if (!created) {
    replyError(*player, created.error().message);
    return;
  }

  auto& lobby = *created;
  sendJoined(*player, *lobby, core::JoinKind::Joined);
  lobby->broadcastRoster();
}

void GameService::handleJoinLobby(const PlayerPtr& player,
                                  const nlohmann::json& body) {
  auto code = protocol::readString(body, "lobby_id");
  if (!code || code->empty()) {
    replyError(*player, "Missing lobby_id");
    return;
  }
  std::transform(code->begin(), code->end(), code->begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (auto current = player->lobbyId()) {
    if (*current != *code) {
      replyError(*player, "Leave your current lobby first");
      return;
    }
  }

  auto lobby = directory_.getLobby(*code);
  if (!lobby) {
    replyError(*player, fmt::format("Lobby {} not found", *code));
    return;
  }

  auto joined = lobby->addPlayer(player);
  if (!joined) {
    replyError(*player, joined.error().message);
    return;
  }

  // 加入期间大厅可能已因清空而被销毁
  if (directory_.getLobby(*code) != lobby) {
    lobby->removePlayer(player->id());
    replyError(*player, fmt::format("Lobby {} not found", *code));
    return;
  }

  sendJoined(*player, *lobby, *joined);
  lobby->broadcastRoster();
}

void GameService::handleUpdateProfile(const PlayerPtr& player,
                                      const nlohmann::json& body) {
  auto lobby = currentLobby(*player);

  if (auto username = protocol::readString(body, "username")) {
    if (*username != player->username()) {
      if (lobby) {
        replyError(*player, "Cannot change username while in a lobby");
        return;
      }
      if (!auth::TokenIdentityProvider::isValidUsername(*username)) {
        replyError(*player, "Invalid username");
        return;
      }
      LOG_INFO << "Player " << player->username() << " renamed to "
               << *username;
      player->setUsername(*username);
    }
  }

  auto color = protocol::readString(body, "color").value_or(player->color());
  auto shape = player->shape();
  if (auto shape_name = protocol::readString(body, "shape")) {
    auto parsed = core::parseShape(*shape_name);
    if (!parsed) {
      replyError(*player, fmt::format("Unknown shape: {}", *shape_name));
      return;
    }
    shape = *parsed;
  }
  player->updateProfile(color, shape);
  saveProfile(*player);

  player->send(protocol::encodeEvent(protocol::outbound::kProfileAck,
                                     {{"player", player->toJson()}}));
  if (lobby) {
    lobby->broadcastRoster();
  }
}

void GameService::handleToggleReady(const PlayerPtr& player) {
  auto lobby = currentLobby(*player);
  if (!lobby) {
    replyError(*player, "Not in a lobby");
    return;
  }

  auto ready = lobby->toggleReady(player->id());
  if (!ready) {
    replyError(*player, ready.error().message);
    return;
  }
  lobby->broadcastRoster();
}

void GameService::handleLeaveLobby(const PlayerPtr& player) {
  if (!currentLobby(*player)) {
    replyError(*player, "Not in a lobby");
    return;
  }
  leaveCurrentLobby(player);
  player->send(protocol::encodeEvent(protocol::outbound::kLobbyLeft,
                                     nlohmann::json::object()));
}

void GameService::handleStartGame(const PlayerPtr& player,
                                  const nlohmann::json& body) {
  auto lobby = currentLobby(*player);
  if (!lobby) {
    replyError(*player, "Not in a lobby");
    return;
  }

  auto tournament = lobby->tournament();
  if (!tournament) {
    replyError(*player, "Lobby cannot host a tournament");
    return;
  }

  const bool test_mode = protocol::readBool(body, "test_mode").value_or(false);
  auto started = tournament->start(player->username(), test_mode);
  if (!started) {
    replyError(*player, started.error().message);
  }
}

void GameService::handleGameInput(const PlayerPtr& player,
                                  const protocol::ClientEvent& event) {
  auto lobby = currentLobby(*player);
  if (!lobby) {
    replyError(*player, "Not in a lobby");
    return;
  }

  auto tournament = lobby->tournament();
  if (!tournament) {
    return;
  }

  auto accepted = tournament->submitInput(player->id(), event.type, event.body);
  if (!accepted) {
    replyError(*player, accepted.error().message);
  }
}

void GameService::handleListLobbies(const PlayerPtr& player) {
  player->send(protocol::encodeEvent(protocol::outbound::kLobbyList,
                                     {{"lobbies", lobbyListing()}}));
}

//------------------------------------------------------------------------------

auto GameService::currentLobby(const core::Player& player) const
    -> std::shared_ptr<core::Lobby> {
  auto code = player.lobbyId();
  if (!code) {
    return nullptr;
  }
  return directory_.getLobby(*code);
}

void GameService::leaveCurrentLobby(const PlayerPtr& player) {
  auto lobby = currentLobby(*player);
  if (!lobby) {
    player->setLobbyId(std::nullopt);
    return;
  }

  const bool empty = lobby->removePlayer(player->id());
  if (empty) {
    directory_.removeLobby(lobby->code());
  } else {
    lobby->broadcastRoster();
  }
}

void GameService::sendJoined(const core::Player& player,
                             const core::Lobby& lobby, core::JoinKind kind) {
  auto payload = core::toJson(lobby.summary());
  payload["rejoined"] = (kind == core::JoinKind::Rejoined);
  payload["is_host"] = player.isHost();
  player.send(
      protocol::encodeEvent(protocol::outbound::kLobbyJoined, payload));
}

void GameService::saveProfile(const core::Player& player) {
  if (!profiles_) {
    return;
  }

  const auto username = player.username();
  auto profile = profiles_->getProfile(username)
                     .value_or(storage::makeDefaultProfile(username));
  profile.set_color(player.color());
  profile.set_shape(core::shapeToString(player.shape()));
  if (auto stored = profiles_->updateProfile(profile); !stored) {
    LOG_ERROR << "Failed to save profile for " << username << ": "
              << stored.error().message;
  }
}

void GameService::replyError(const core::Player& player,
                             const std::string& message) {
  player.send(protocol::encodeError(message));
}

}  // namespace mayhem::network
