#include "config_manager.hpp"

#include <cstdlib>
#include <fstream>
#include <vector>

#include "common/constants.hpp"
#include "common/logging.hpp"

namespace mayhem::common {

using json = nlohmann::json;

namespace {

auto splitKey(const std::string& key) -> std::vector<std::string> {
  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= key.size()) {
    const auto dot = key.find('.', start);
    const auto end = dot == std::string::npos ? key.size() : dot;
    if (end > start) {
      parts.push_back(key.substr(start, end - start));
    }
    start = end + 1;
  }
  return parts;
}

auto lookup(const json& root, const std::string& key) -> const json* {
  const json* node = &root;
  for (const auto& part : splitKey(key)) {
    if (!node->is_object()) {
      return nullptr;
    }
    auto it = node->find(part);
    if (it == node->end()) {
      return nullptr;
    }
    node = &*it;
  }
  return node;
}

}  // namespace

ConfigResult<void> ConfigManager::loadFromFile(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    return tl::make_unexpected(
        ConfigError{"Failed to open config file: " + filename});
  }

  json document = json::parse(file, nullptr, false);
  if (document.is_discarded()) {
    return tl::make_unexpected(
        ConfigError{"Failed to parse config file: " + filename});
  }

  {
    std::unique_lock lock(mutex_);
    replaceNoLock(std::move(document));
  }
  LOG_INFO << "Loaded config from: " << filename;
  return {};
}

ConfigResult<void> ConfigManager::loadFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return tl::make_unexpected(
        ConfigError{"Config root must be an object, got " +
                    std::string(json.type_name())});
  }
  std::unique_lock lock(mutex_);
  replaceNoLock(json);
  return {};
}

ConfigResult<void> ConfigManager::saveToFile(
    const std::string& filename) const {
  std::ofstream file(filename);
  if (!file.is_open()) {
    return tl::make_unexpected(
        ConfigError{"Failed to open file for writing: " + filename});
  }

  std::shared_lock lock(mutex_);
  file << config_.dump(4);
  if (!file) {
    return tl::make_unexpected(
        ConfigError{"Failed to write config file: " + filename});
  }
  return {};
}

nlohmann::json ConfigManager::getConfig() const {
  std::shared_lock lock(mutex_);
  return config_;
}

uint16_t ConfigManager::getServicePort() const {
  const auto port = getInt("server.port");
  if (!port) {
    return constants::kDefaultServicePort;
  }
  if (*port < 1 || *port > 65535) {
    LOG_WARNING << "Invalid server.port " << *port << ", using default port "
                << constants::kDefaultServicePort;
    return constants::kDefaultServicePort;
  }
  return static_cast<uint16_t>(*port);
}

bool ConfigManager::validateConfig() const {
  bool valid = true;

  if (auto port = getJsonValue("server.port")) {
    if (!port->is_number_integer() || port->get<int>() < 1 ||
        port->get<int>() > 65535) {
      LOG_ERROR << "Invalid server.port: " << port->dump()
                << " (expected integer in 1-65535)";
      valid = false;
    }
  }

  for (const auto* key :
       {"tournament.preview_delay_ms", "tournament.intermission_delay_ms",
        "tournament.math_duration_ms", "tournament.typing_duration_ms",
        "tournament.race_duration_ms"}) {
    auto value = getJsonValue(key);
    if (value && (!value->is_number_integer() || value->get<int>() < 0)) {
      LOG_ERROR << "Invalid duration for '" << key << "': " << value->dump();
      valid = false;
    }
  }

  auto rounds = getJsonValue("tournament.max_rounds");
  if (rounds && (!rounds->is_number_integer() || rounds->get<int>() < 1)) {
    LOG_ERROR << "Invalid tournament.max_rounds: " << rounds->dump();
    valid = false;
  }

  if (!valid) {
    LOG_ERROR << "Configuration validation failed";
  }
  return valid;
}

ConfigResult<nlohmann::json> ConfigManager::getJsonValue(
    const std::string& key) const {
  {
    std::shared_lock lock(mutex_);
    if (auto it = cache_.find(key); it != cache_.end()) {
      return it->second;
    }
  }

  std::unique_lock lock(mutex_);
  const json* node = lookup(config_, key);
  if (node == nullptr) {
    return tl::make_unexpected(ConfigError{"Key not found: " + key});
  }
  return cache_.try_emplace(key, *node).first->second;
}

ConfigError ConfigManager::typeMismatch(const std::string& key,
                                        const char* expected,
                                        const nlohmann::json& actual) {
  LOG_WARNING << "Config value type mismatch for key '" << key
              << "': expected " << expected << ", got " << actual.type_name();
  return ConfigError{"Value at key '" + key + "' is not a " + expected};
}

void ConfigManager::replaceNoLock(nlohmann::json document) {
  config_ = std::move(document);
  cache_.clear();
  applyEnvironmentNoLock();
  warnMissingKeysNoLock();
}

void ConfigManager::assignNoLock(const std::string& key, nlohmann::json value) {
  const auto parts = splitKey(key);
  if (parts.empty()) {
    return;
  }

  json* node = &config_;
  for (const auto& part : parts) {
    if (!node->is_object()) {
      *node = json::object();
    }
    node = &(*node)[part];
  }
  *node = std::move(value);
}

void ConfigManager::applyEnvironmentNoLock() {
  if (const char* port = std::getenv("MAYHEM_PORT")) {
    char* end = nullptr;
    const long value = std::strtol(port, &end, 10);
    if (end != port && *end == '\0') {
      assignNoLock("server.port", static_cast<int>(value));
    } else {
      LOG_WARNING << "Invalid MAYHEM_PORT value: " << port;
    }
  }

  if (const char* token = std::getenv("MAYHEM_AUTH_TOKEN")) {
    assignNoLock("auth.token", std::string(token));
  }

  if (const char* test_mode = std::getenv("MAYHEM_ALLOW_TEST_MODE")) {
    const std::string value(test_mode);
    assignNoLock("tournament.allow_test_mode", value == "true" || value == "1");
  }
}

void ConfigManager::warnMissingKeysNoLock() const {
  for (const auto* key : {"server.port", "server.host",
                          "tournament.max_rounds", "logging.level"}) {
    if (lookup(config_, key) == nullptr) {
      LOG_DEBUG << "Config key '" << key << "' not set, using default";
    }
  }
}

}  // namespace mayhem::common
