#include "profile_store.hpp"

#include <fmt/format.h>

#include <fstream>
#include <system_error>
#include <utility>

#include "common/logging.hpp"
#include "core/player.hpp"

namespace mayhem::storage {

auto makeDefaultProfile(const Username& username) -> PlayerProfile {
  PlayerProfile profile;
  profile.set_username(username);
  profile.set_color(core::kDefaultPlayerColor);
  profile.set_shape(core::shapeToString(core::Shape::Circle));
  return profile;
}

//-----------------------------------------------------------------------------
// InMemoryProfileStore
//-----------------------------------------------------------------------------

auto InMemoryProfileStore::getProfile(const Username& username) const
    -> std::optional<PlayerProfile> {
  std::lock_guard lock(mutex_);
  auto it = profiles_.find(username);
  if (it == profiles_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto InMemoryProfileStore::updateProfile(const PlayerProfile& profile)
    -> StoreResult<void> {
  if (profile.username().empty()) {
    return tl::make_unexpected(StoreError{"Profile has no username"});
  }
  std::lock_guard lock(mutex_);
  profiles_[profile.username()] = profile;
  return {};
}

//-----------------------------------------------------------------------------
// FileProfileStore
//-----------------------------------------------------------------------------

FileProfileStore::FileProfileStore(OpenTag /*tag*/, std::filesystem::path path,
                                   ProfileSnapshot snapshot)
    : path_(std::move(path)), snapshot_(std::move(snapshot)) {}

auto FileProfileStore::open(const std::filesystem::path& path)
    -> StoreResult<std::unique_ptr<FileProfileStore>> {
  ProfileSnapshot snapshot;

  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
      return tl::make_unexpected(StoreError{
          fmt::format("Cannot open profile store: {}", path.string())});
    }
    if (!snapshot.ParseFromIstream(&input)) {
      return tl::make_unexpected(StoreError{
          fmt::format("Corrupted profile store: {}", path.string())});
    }
    LOG_INFO << "Loaded " << snapshot.profiles_size() << " profiles from "
             << path.string();
  } else {
    LOG_INFO << "Profile store " << path.string()
             << " does not exist yet, starting empty";
  }

  return std::make_unique<FileProfileStore>(OpenTag{}, path,
                                            std::move(snapshot));
}

auto FileProfileStore::getProfile(const Username& username) const
    -> std::optional<PlayerProfile> {
  std::lock_guard lock(mutex_);
  const auto& profiles = snapshot_.profiles();
  auto it = profiles.find(username);
  if (it == profiles.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto FileProfileStore::updateProfile(const PlayerProfile& profile)
    -> StoreResult<void> {
  if (profile.username().empty()) {
    return tl::make_unexpected(StoreError{"Profile has no username"});
  }
  std::lock_guard lock(mutex_);
  (*snapshot_.mutable_profiles())[profile.username()] = profile;
  return persistNoLock();
}

// 调用者已持有 mutex_
auto FileProfileStore::persistNoLock() const -> StoreResult<void> {
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return tl::make_unexpected(StoreError{fmt::format(
          "Cannot create directory for {}: {}", path_.string(), ec.message())});
    }
  }

  auto temp_path = path_;
  temp_path += ".tmp";
  {
    std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
    if (!output || !snapshot_.SerializeToOstream(&output)) {
      return tl::make_unexpected(StoreError{
          fmt::format("Failed to write {}", temp_path.string())});
    }
  }

  std::filesystem::rename(temp_path, path_, ec);
  if (ec) {
    return tl::make_unexpected(StoreError{fmt::format(
        "Failed to replace {}: {}", path_.string(), ec.message())});
  }
  return {};
}

}  // namespace mayhem::storage
