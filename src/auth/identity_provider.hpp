#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tl/expected.hpp>

#include "common/types.hpp"

namespace mayhem::auth {

enum class AuthErrorCode : std::uint8_t {
  InvalidTarget,
  InvalidUsername,
  InvalidToken
};

struct AuthError {
  AuthErrorCode code;
  std::string message;
};

/// 已验证的身份
struct Identity {
  Username username;
};

/**
 * @brief 在 WebSocket 握手前把凭据转换为已验证的用户名
 */
class IdentityProvider {
 public:
  virtual ~IdentityProvider() = default;

  /**
   * @param target HTTP 请求目标，例如 "/ws/alice?token=secret"
   */
  virtual auto authenticate(std::string_view target) const
      -> tl::expected<Identity, AuthError> = 0;
};

/**
 * @brief 基于共享令牌的身份验证
 *
 * 用户名取自路径 /ws/<username>，必须为1到32个 [A-Za-z0-9_-] 字符。
 * 配置了令牌时，查询参数 token 必须与之相同。
 */
class TokenIdentityProvider : public IdentityProvider {
 public:
  explicit TokenIdentityProvider(std::optional<std::string> token = std::nullopt);

  auto authenticate(std::string_view target) const
      -> tl::expected<Identity, AuthError> override;

  static auto isValidUsername(std::string_view username) -> bool;

 private:
  std::optional<std::string> token_;
};

/// @brief 百分号解码；格式错误时返回空
auto percentDecode(std::string_view text) -> std::optional<std::string>;

/// @brief 从查询串中取出某个参数（已解码）
auto queryParameter(std::string_view query, std::string_view name)
    -> std::optional<std::string>;

}  // namespace mayhem::auth
