#include "network/websocket_server.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include "common/constants.hpp"
#include "common/logging.hpp"
#include "network/error_context.hpp"
#include "network/game_service.hpp"

namespace mayhem::network {

namespace {

constexpr const char* kServerName = "Mayhem Server";
constexpr std::string_view kLobbiesTarget = "/api/lobbies";

}  // namespace

//------------------------------------------------------------------------------
// Listener implementation

Listener::Listener(net::io_context& ioc, const tcp::endpoint& endpoint,
                   WebsocketServer& server)
    : ioc_(ioc), acceptor_(net::make_strand(ioc)), server_(server) {
  beast::error_code ec;
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    throw std::runtime_error(fmt::format("Failed to listen on {}:{}: {}",
                                         endpoint.address().to_string(),
                                         endpoint.port(), ec.message()));
  }
}

void Listener::stop() {
  net::post(acceptor_.get_executor(), [self = shared_from_this()] {
    beast::error_code ec;
    self->acceptor_.close(ec);
    if (ec) {
      LOG_WARNING << "Failed to close acceptor: " << ec.message();
    }
  });
}

auto Listener::localPort() const -> Port {
  beast::error_code ec;
  auto endpoint = acceptor_.local_endpoint(ec);
  return ec ? Port{0} : endpoint.port();
}

void Listener::do_accept() {
  // 每个连接拥有自己的strand
  acceptor_.async_accept(
      net::make_strand(ioc_),
      beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
}

void Listener::on_accept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) {
    LOG_DEBUG << "Listener stopped";
    return;
  }

  if (ec) {
    NetworkContext ctx("accept", "listener");
    ErrorLogger::logNetworkError(ctx, ec, "Failed to accept new connection");
  } else {
    std::make_shared<HttpSession>(std::move(socket), server_)->run();
  }

  // Accept another connection
  do_accept();
}

//------------------------------------------------------------------------------
// HttpSession implementation

HttpSession::HttpSession(tcp::socket&& socket, WebsocketServer& server)
    : stream_(std::move(socket)), server_(server) {
  endpoint_ = describeEndpoint(stream_.socket());
}

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::do_read,
                                          shared_from_this()));
}

void HttpSession::do_read() {
  parser_.emplace();
  parser_->body_limit(constants::kMaxMessageSize);

  stream_.expires_after(constants::kDefaultHandshakeTimeout);
  http::async_read(
      stream_, buffer_, *parser_,
      beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
  if (ec == http::error::end_of_stream) {
    do_close();
    return;
  }

  if (ec) {
    NetworkContext ctx("http_read", endpoint_);
    ctx.bytes_transferred = bytes_transferred;
    ErrorLogger::logNetworkError(ctx, ec, "HTTP read failed");
    return;
  }

  const auto& req = parser_->get();
  if (websocket::is_upgrade(req)) {
    upgrade(req);
    return;
  }
  handleRequest(req);
}

void HttpSession::handleRequest(const http::request<http::string_body>& req) {
  const std::string_view target{req.target().data(), req.target().size()};
  LOG_DEBUG << "HTTP " << http::to_string(req.method()).data() << " "
            << std::string(target) << " from " << endpoint_;

  if (req.method() == http::verb::get && target == kLobbiesTarget) {
    sendResponse(http::status::ok, req.version(), req.keep_alive(),
                 "application/json", server_.service().lobbyListing().dump());
    return;
  }

  sendResponse(http::status::not_found, req.version(), req.keep_alive(),
               "text/plain", "Not found");
}

void HttpSession::upgrade(const http::request<http::string_body>& req) {
  const std::string_view target{req.target().data(), req.target().size()};
  auto identity = server_.identity().authenticate(target);
  if (!identity) {
    LOG_WARNING << "Rejected WebSocket upgrade from " << endpoint_ << ": "
                << identity.error().message;
    sendResponse(http::status::unauthorized, req.version(), false,
                 "text/plain", identity.error().message);
    return;
  }

  auto session = std::make_shared<WebsocketSession>(
      stream_.release_socket(), server_, std::move(*identity));
  server_.onSessionOpened(session);
  session->run(req);
}

void HttpSession::sendResponse(http::status status, unsigned version,
                               bool keep_alive,
                               const std::string& content_type,
                               std::string body) {
  response_ = {};
  response_.result(status);
  response_.version(version);
  response_.set(http::field::server, kServerName);
  response_.set(http::field::content_type, content_type);
  response_.keep_alive(keep_alive);
  response_.body() = std::move(body);
  response_.prepare_payload();

  http::async_write(stream_, response_,
                    beast::bind_front_handler(&HttpSession::on_write,
                                              shared_from_this(),
                                              response_.need_eof()));
}

void HttpSession::on_write(bool close, beast::error_code ec,
                           std::size_t bytes_transferred) {
  if (ec) {
    NetworkContext ctx("http_write", endpoint_);
    ctx.bytes_transferred = bytes_transferred;
    ErrorLogger::logNetworkError(ctx, ec, "HTTP write failed");
    return;
  }

  if (close) {
    do_close();
    return;
  }
  do_read();
}

void HttpSession::do_close() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  if (ec && !ErrorHelper::isClientDisconnect(ec)) {
    LOG_DEBUG << "HTTP shutdown for " << endpoint_ << ": " << ec.message();
  }
}

//------------------------------------------------------------------------------
// WebsocketSession implementation

WebsocketSession::WebsocketSession(tcp::socket&& socket,
                                   WebsocketServer& server,
                                   auth::Identity identity)
    : ws_{std::move(socket)},
      server_{server},
      identity_{std::move(identity)} {
  endpoint_ = describeEndpoint(ws_.next_layer().socket());
}

void WebsocketSession::run(const http::request<http::string_body>& req) {
  // HTTP阶段的超时交给WebSocket自己的超时设置
  beast::get_lowest_layer(ws_).expires_never();
  ws_.set_option(
      websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws_.set_option(
      websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, kServerName);
      }));
  ws_.read_message_max(constants::kMaxMessageSize);
  ws_.text(true);

  ws_.async_accept(req, beast::bind_front_handler(&WebsocketSession::on_accept,
                                                  shared_from_this()));
}

void WebsocketSession::on_accept(beast::error_code ec) {
  NetworkContext ctx("accept", endpoint_);
  ctx.username = identity_.username;

  if (ec) {
    ErrorLogger::logNetworkError(ctx, ec, "WebSocket handshake failed");
    shutdown();
    return;
  }

  auto player =
      server_.service().onConnectionOpened(shared_from_this(), identity_.username);
  connection_id_ = player->id();
  ctx.connection_id = connection_id_;
  ErrorLogger::logOperationSuccess(ctx);

  do_read();
}

void WebsocketSession::do_read() {
  ws_.async_read(buffer_, beast::bind_front_handler(&WebsocketSession::on_read,
                                                    shared_from_this()));
}

void WebsocketSession::on_read(beast::error_code ec,
                               std::size_t bytes_transferred) {
  if (ec) {
    NetworkContext ctx("read", endpoint_);
    ctx.connection_id = connection_id_;
    ctx.username = identity_.username;
    ctx.bytes_transferred = bytes_transferred;
    ErrorLogger::logNetworkError(ctx, ec, "Read operation failed");
    shutdown();
    return;
  }

  auto message = beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());

  server_.service().processMessage(connection_id_, message);
  do_read();
}

void WebsocketSession::send(const std::string& message) {
  net::post(ws_.get_executor(), [self = shared_from_this(), message] {
    if (self->closed_) {
      return;
    }
    if (self->write_queue_.size() >= constants::kMaxMessageQueueSize) {
      NetworkContext ctx("write", self->endpoint_);
      ctx.connection_id = self->connection_id_;
      ErrorLogger::logPerformanceWarning(
          ctx, "Outbound queue full, message dropped",
          fmt::format("{} messages", constants::kMaxMessageQueueSize));
      return;
    }

    self->write_queue_.push_back(message);
    if (self->write_queue_.size() == 1) {
      self->do_write();
    }
  });
}

void WebsocketSession::do_write() {
  ws_.async_write(
      net::buffer(write_queue_.front()),
      beast::bind_front_handler(&WebsocketSession::on_write,
                                shared_from_this()));
}

void WebsocketSession::on_write(beast::error_code ec,
                                std::size_t bytes_transferred) {
  NetworkContext ctx("write", endpoint_);
  ctx.connection_id = connection_id_;
  ctx.username = identity_.username;
  ctx.bytes_transferred = bytes_transferred;

  if (ec) {
    ErrorLogger::logNetworkError(ctx, ec, "Write operation failed");
    beast::get_lowest_layer(ws_).close();
    shutdown();
    return;
  }

  ErrorLogger::logOperationSuccess(ctx);

  write_queue_.pop_front();
  if (!write_queue_.empty()) {
    do_write();
  }
}

void WebsocketSession::close() {
  net::post(ws_.get_executor(), [self = shared_from_this()] {
    beast::get_lowest_layer(self->ws_).close();
  });
}

void WebsocketSession::shutdown() {
  if (closed_) {
    return;
  }
  closed_ = true;
  write_queue_.clear();
  server_.onSessionClosed(shared_from_this());
}

//------------------------------------------------------------------------------
// WebsocketServer implementation

WebsocketServer::WebsocketServer(net::io_context& ioc, GameService& service,
                                 const auth::IdentityProvider& identity)
    : ioc_{ioc}, service_{service}, identity_{identity} {}

WebsocketServer::~WebsocketServer() {
  if (is_running_) {
    stop();
  }
}

void WebsocketServer::start(const std::string& address, Port port,
                            ThreadCount thread_count) {
  if (is_running_) {
    LOG_WARNING << "WebSocket server is already running";
    return;
  }

  auto server_address = net::ip::make_address(address);
  listener_ = std::make_shared<Listener>(
      ioc_, tcp::endpoint{server_address, port}, *this);
  listener_->run();

  thread_count = std::clamp(thread_count, 1, constants::kMaxThreadCount);
  threads_.reserve(thread_count);
  for (int i = 0; i < thread_count; ++i) {
    threads_.emplace_back([this] { ioc_.run(); });
  }

  is_running_ = true;
  LOG_INFO << fmt::format("WebSocket server started on {}:{} ({} threads)",
                          address, listener_->localPort(), thread_count);
}

void WebsocketServer::stop() {
  if (!is_running_) {
    return;
  }

  LOG_INFO << "Stopping WebSocket server...";
  listener_->stop();

  std::set<std::shared_ptr<WebsocketSession>> sessions_copy;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_copy.swap(sessions_);
  }
  for (const auto& session : sessions_copy) {
    session->close();
  }

  net::post(ioc_, [this] { ioc_.stop(); });

  for (auto& t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
  threads_.clear();

  is_running_ = false;
  LOG_INFO << "WebSocket server stopped";
}

auto WebsocketServer::port() const -> Port {
  return listener_ ? listener_->localPort() : Port{0};
}

void WebsocketServer::onSessionOpened(
    const std::shared_ptr<WebsocketSession>& session) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.insert(session);
  LOG_DEBUG << "WebSocket upgrade for " << session->username()
            << ". Total connections: " << sessions_.size();
}

void WebsocketServer::onSessionClosed(
    const std::shared_ptr<WebsocketSession>& session) {
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session);
    LOG_DEBUG << "Client disconnected. Total connections: "
              << sessions_.size();
  }

  if (!session->connectionId().empty()) {
    service_.onConnectionClosed(session->connectionId());
  }
}

}  // namespace mayhem::network
