#include "identity_provider.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <utility>

#include "common/constants.hpp"

namespace mayhem::auth {

namespace {

constexpr std::string_view kWebsocketPrefix = "/ws/";

auto hexValue(char c) -> int {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

auto percentDecode(std::string_view text) -> std::optional<std::string> {
  std::string decoded;
  decoded.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '+') {
      decoded.push_back(' ');
    } else if (c == '%') {
      if (i + 2 >= text.size()) {
        return std::nullopt;
      }
      const int high = hexValue(text[i + 1]);
      const int low = hexValue(text[i + 2]);
      if (high < 0 || low < 0) {
        return std::nullopt;
      }
      decoded.push_back(static_cast<char>(high * 16 + low));
      i += 2;
    } else {
      decoded.push_back(c);
    }
  }
  return decoded;
}

auto queryParameter(std::string_view query, std::string_view name)
    -> std::optional<std::string> {
  while (!query.empty()) {
    const auto amp = query.find('&');
    const auto pair = query.substr(0, amp);
    const auto eq = pair.find('=');
    if (pair.substr(0, eq) == name) {
      if (eq == std::string_view::npos) {
        return std::string{};
      }
      return percentDecode(pair.substr(eq + 1));
    }
    if (amp == std::string_view::npos) {
      break;
    }
    query.remove_prefix(amp + 1);
  }
  return std::nullopt;
}

TokenIdentityProvider::TokenIdentityProvider(std::optional<std::string> token)
    : token_(std::move(token)) {
  if (token_ && token_->empty()) {
    token_.reset();
  }
}

auto TokenIdentityProvider::isValidUsername(std::string_view username)
    -> bool {
  if (username.empty() || username.size() > constants::kMaxUsernameLength) {
    return false;
  }
  return std::all_of(username.begin(), username.end(), [](unsigned char c) {
    return std::isalnum(c) != 0 || c == '_' || c == '-';
  });
}

auto TokenIdentityProvider::authenticate(std::string_view target) const
    -> tl::expected<Identity, AuthError> {
  if (target.substr(0, kWebsocketPrefix.size()) != kWebsocketPrefix) {
    return tl::make_unexpected(
        AuthError{AuthErrorCode::InvalidTarget,
                  fmt::format("Unsupported target: {}", target)});
  }
  target.remove_prefix(kWebsocketPrefix.size());

  const auto question = target.find('?');
  const auto path = target.substr(0, question);
  const auto query = question == std::string_view::npos
                         ? std::string_view{}
                         : target.substr(question + 1);

  auto username = percentDecode(path);
  if (!username || !isValidUsername(*username)) {
    return tl::make_unexpected(
        AuthError{AuthErrorCode::InvalidUsername, "Invalid username"});
  }

  if (token_) {
    auto presented = queryParameter(query, "token");
    if (!presented || *presented != *token_) {
      return tl::make_unexpected(
          AuthError{AuthErrorCode::InvalidToken, "Invalid token"});
    }
  }

  return Identity{std::move(*username)};
}

}  // namespace mayhem::auth
