#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <tl/expected.hpp>
#include <type_traits>
#include <unordered_map>

namespace mayhem::common {

/**
 * @brief 配置错误类型
 */
struct ConfigError {
  std::string message;

  explicit ConfigError(std::string msg) : message(std::move(msg)) {}
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

/**
 * @brief 服务器配置
 *
 * 以 JSON 文档保存，键为点分隔路径（例如 "tournament.max_rounds"）。
 * 由 main 构造后以引用传给各个组件，加载时应用 MAYHEM_* 环境变量覆盖。
 */
class ConfigManager {
 public:
  ConfigManager() = default;
  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  ConfigResult<void> loadFromFile(const std::string& filename);
  ConfigResult<void> loadFromJson(const nlohmann::json& json);
  ConfigResult<void> saveToFile(const std::string& filename) const;

  /**
   * @brief 读取指定类型的值，键不存在或类型不符时返回错误
   */
  template <typename T>
  ConfigResult<T> get(const std::string& key) const {
    auto node = getJsonValue(key);
    if (!node) {
      return tl::make_unexpected(node.error());
    }
    if (!holds<T>(*node)) {
      return tl::make_unexpected(typeMismatch(key, typeLabel<T>(), *node));
    }
    return node->template get<T>();
  }

  ConfigResult<std::string> getString(const std::string& key) const {
    return get<std::string>(key);
  }
  ConfigResult<int> getInt(const std::string& key) const {
    return get<int>(key);
  }
  ConfigResult<bool> getBool(const std::string& key) const {
    return get<bool>(key);
  }
  ConfigResult<double> getDouble(const std::string& key) const {
    return get<double>(key);
  }

  template <typename T>
  T getWithDefault(const std::string& key, const T& default_value) const {
    return get<T>(key).value_or(default_value);
  }

  // server.port，越界或缺失时使用 kDefaultServicePort
  uint16_t getServicePort() const;

  template <typename T>
  void set(const std::string& key, const T& value) {
    std::unique_lock lock(mutex_);
    assignNoLock(key, nlohmann::json(value));
    cache_.clear();
  }

  bool hasKey(const std::string& key) const {
    return getJsonValue(key).has_value();
  }

  nlohmann::json getConfig() const;

  // 检查端口、锦标赛时长与轮数，问题写入日志
  bool validateConfig() const;

 private:
  template <typename T>
  static bool holds(const nlohmann::json& node) {
    if constexpr (std::is_same_v<T, bool>) {
      return node.is_boolean();
    } else if constexpr (std::is_integral_v<T>) {
      return node.is_number_integer();
    } else if constexpr (std::is_floating_point_v<T>) {
      return node.is_number();
    } else if constexpr (std::is_same_v<T, std::string>) {
      return node.is_string();
    } else {
      return true;
    }
  }

  template <typename T>
  static const char* typeLabel() {
    if constexpr (std::is_same_v<T, bool>) {
      return "boolean";
    } else if constexpr (std::is_integral_v<T>) {
      return "integer";
    } else if constexpr (std::is_floating_point_v<T>) {
      return "number";
    } else if constexpr (std::is_same_v<T, std::string>) {
      return "string";
    } else {
      return "value";
    }
  }

  ConfigResult<nlohmann::json> getJsonValue(const std::string& key) const;
  static ConfigError typeMismatch(const std::string& key, const char* expected,
                                  const nlohmann::json& actual);

  // 以下方法要求调用者持有 mutex_
  void replaceNoLock(nlohmann::json document);
  void assignNoLock(const std::string& key, nlohmann::json value);
  void applyEnvironmentNoLock();
  void warnMissingKeysNoLock() const;

  mutable std::shared_mutex mutex_;
  nlohmann::json config_;
  mutable std::unordered_map<std::string, nlohmann::json> cache_;
};

}  // namespace mayhem::common
