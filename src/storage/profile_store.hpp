#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tl/expected.hpp>

#include "common/types.hpp"
#include "profile.pb.h"

namespace mayhem::storage {

struct StoreError {
  std::string message;
};

template <typename T>
using StoreResult = tl::expected<T, StoreError>;

/**
 * @brief 玩家资料存储的窄接口
 *
 * 会话开始时读取，修改资料和锦标赛结束时写入。大厅逻辑不直接依赖它。
 */
class ProfileStore {
 public:
  virtual ~ProfileStore() = default;

  virtual auto getProfile(const Username& username) const
      -> std::optional<PlayerProfile> = 0;
  virtual auto updateProfile(const PlayerProfile& profile)
      -> StoreResult<void> = 0;
};

/// 新玩家的空白资料
auto makeDefaultProfile(const Username& username) -> PlayerProfile;

class InMemoryProfileStore : public ProfileStore {
 public:
  auto getProfile(const Username& username) const
      -> std::optional<PlayerProfile> override;
  auto updateProfile(const PlayerProfile& profile) -> StoreResult<void> override;

 private:
  mutable std::mutex mutex_;
  std::map<Username, PlayerProfile> profiles_;
};

/**
 * @brief 以 protobuf 快照持久化到单个文件
 *
 * 每次更新都完整重写文件（先写临时文件再改名）。
 */
class FileProfileStore : public ProfileStore {
  struct OpenTag {
    explicit OpenTag() = default;
  };

 public:
  // 只能经由 open() 构造
  FileProfileStore(OpenTag, std::filesystem::path path,
                   ProfileSnapshot snapshot);

  /**
   * @brief 打开存储文件；文件不存在时从空快照开始
   */
  static auto open(const std::filesystem::path& path)
      -> StoreResult<std::unique_ptr<FileProfileStore>>;

  auto getProfile(const Username& username) const
      -> std::optional<PlayerProfile> override;
  auto updateProfile(const PlayerProfile& profile) -> StoreResult<void> override;

  [[nodiscard]] auto path() const -> const std::filesystem::path& {
    return path_;
  }

 private:
  auto persistNoLock() const -> StoreResult<void>;

  const std::filesystem::path path_;
  mutable std::mutex mutex_;
  ProfileSnapshot snapshot_;
};

}  // namespace mayhem::storage
