#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "auth/identity_provider.hpp"
#include "common/types.hpp"
#include "core/message_sink.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

namespace mayhem::network {

class GameService;
class WebsocketServer;  // Forward declaration

/**
 * @brief 已升级的WebSocket连接
 *
 * 实现核心层的出站消息通道。所有写操作都在连接的strand上排队，
 * 队列超过上限时丢弃新消息并记录警告。
 */
class WebsocketSession : public core::MessageSink,
                         public std::enable_shared_from_this<WebsocketSession> {
  websocket::stream<beast::tcp_stream> ws_;
  beast::flat_buffer buffer_;
  WebsocketServer& server_;
  auth::Identity identity_;
  std::string endpoint_;
  ConnectionId connection_id_;
  std::deque<std::string> write_queue_;
  bool closed_ = false;

 public:
  WebsocketSession(tcp::socket&& socket, WebsocketServer& server,
                   auth::Identity identity);

  // 用升级请求完成WebSocket握手
  void run(const http::request<http::string_body>& req);

  void send(const std::string& message) override;
  void close();

  auto connectionId() const -> const ConnectionId& { return connection_id_; }
  auto username() const -> const Username& { return identity_.username; }

 private:
  void on_accept(beast::error_code ec);
  void do_read();
  void on_read(beast::error_code ec, std::size_t bytes_transferred);
  void do_write();
  void on_write(beast::error_code ec, std::size_t bytes_transferred);
  void shutdown();
};

/**
 * @brief 普通HTTP连接：REST查询或WebSocket升级
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  WebsocketServer& server_;
  std::string endpoint_;
  std::optional<http::request_parser<http::string_body>> parser_;
  http::response<http::string_body> response_;

 public:
  HttpSession(tcp::socket&& socket, WebsocketServer& server);

  void run();

 private:
  void do_read();
  void on_read(beast::error_code ec, std::size_t bytes_transferred);
  void handleRequest(const http::request<http::string_body>& req);
  void upgrade(const http::request<http::string_body>& req);
  void sendResponse(http::status status, unsigned version, bool keep_alive,
                    const std::string& content_type, std::string body);
  void on_write(bool close, beast::error_code ec,
                std::size_t bytes_transferred);
  void do_close();
};

// Accepts incoming connections and launches the sessions
class Listener : public std::enable_shared_from_this<Listener> {
  net::io_context& ioc_;
  tcp::acceptor acceptor_;
  WebsocketServer& server_;

 public:
  /**
   * @throws std::runtime_error 无法绑定或监听端点时
   */
  Listener(net::io_context& ioc, const tcp::endpoint& endpoint,
           WebsocketServer& server);

  void run() { do_accept(); }

  void stop();

  auto localPort() const -> Port;

 private:
  void do_accept();
  void on_accept(beast::error_code ec, tcp::socket socket);
};

class WebsocketServer {
 public:
  WebsocketServer(net::io_context& ioc, GameService& service,
                  const auth::IdentityProvider& identity);
  ~WebsocketServer();

  WebsocketServer(const WebsocketServer&) = delete;
  auto operator=(const WebsocketServer&) -> WebsocketServer& = delete;

  /**
   * @brief 开始监听并启动IO线程
   *
   * @param port 为0时由系统分配，实际端口见 port()
   */
  void start(const std::string& address, Port port, ThreadCount thread_count);
  void stop();

  auto port() const -> Port;
  auto isRunning() const -> bool { return is_running_; }

  void onSessionOpened(const std::shared_ptr<WebsocketSession>& session);
  void onSessionClosed(const std::shared_ptr<WebsocketSession>& session);

  auto service() -> GameService& { return service_; }
  auto identity() const -> const auth::IdentityProvider& { return identity_; }

 private:
  net::io_context& ioc_;
  GameService& service_;
  const auth::IdentityProvider& identity_;
  std::shared_ptr<Listener> listener_;
  std::set<std::shared_ptr<WebsocketSession>> sessions_;
  std::mutex sessions_mutex_;
  std::vector<std::thread> threads_;
  bool is_running_ = false;
};

}  // namespace mayhem::network
