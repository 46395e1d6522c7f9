#pragma once

#include <boost/asio/io_context.hpp>
#include <memory>
#include <string>

#include "common/types.hpp"

namespace net = boost::asio;

namespace mayhem {
namespace common {
class ConfigManager;
}
namespace auth {
class IdentityProvider;
}
namespace storage {
class ProfileStore;
}
namespace network {
class GameService;
class WebsocketServer;
}  // namespace network

namespace server {

/**
 * @brief 组装并运行整个服务
 *
 * 根据配置构造资料存储、身份提供者、游戏服务和传输层。
 */
class Server {
 public:
  /**
   * @throws std::runtime_error 资料文件无法打开时
   */
  explicit Server(const common::ConfigManager& config);
  ~Server();

  void start();
  void stop();

  [[nodiscard]] auto port() const -> Port;
  [[nodiscard]] auto service() -> network::GameService&;

 private:
  std::string address_;
  Port port_;
  ThreadCount thread_count_;

  std::unique_ptr<net::io_context> ioc_;
  std::shared_ptr<storage::ProfileStore> profiles_;
  std::unique_ptr<auth::IdentityProvider> identity_;
  std::unique_ptr<network::GameService> service_;
  std::unique_ptr<network::WebsocketServer> ws_server_;
};

}  // namespace server
}  // namespace mayhem
