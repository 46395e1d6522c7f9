#pragma once

/**
 * @file error_context.hpp
 * @brief 传输层错误的上下文与分类
 *
 * 为每次网络操作附带端点、连接和用户信息，
 * 并按 断开 / 可重试 / 严重 三类记录日志。
 */

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/websocket/error.hpp>
#include <chrono>
#include <string>
#include <utility>

#include "common/logging.hpp"

namespace mayhem::network {

/**
 * @brief 网络操作的上下文信息
 */
struct NetworkContext {
  std::string operation;      // 操作类型 (e.g., "accept", "read", "write")
  std::string endpoint;       // 客户端端点信息
  std::string connection_id;  // 连接ID (握手完成后)
  std::string username;       // 用户名 (握手完成后)
  std::chrono::steady_clock::time_point start_time;
  size_t bytes_transferred = 0;

  NetworkContext(std::string op, std::string ep)
      : operation(std::move(op)),
        endpoint(std::move(ep)),
        start_time(std::chrono::steady_clock::now()) {}

  [[nodiscard]] auto elapsed() const -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
  }
};

/**
 * @brief 不抛异常地描述套接字的远端地址
 */
inline auto describeEndpoint(const boost::asio::ip::tcp::socket& socket)
    -> std::string {
  boost::system::error_code ec;
  auto remote = socket.remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return remote.address().to_string() + ":" + std::to_string(remote.port());
}

/**
 * @brief 错误类别辅助函数
 */
class ErrorHelper {
 public:
  /**
   * @brief 判断错误是否是客户端断开连接
   */
  static bool isClientDisconnect(const boost::beast::error_code& ec) {
    return ec == boost::beast::websocket::error::closed ||
           ec == boost::beast::http::error::end_of_stream ||
           ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::eof;
  }

  /**
   * @brief 判断错误是否可重试
   */
  static bool isRetryableError(const boost::beast::error_code& ec) {
    return ec == boost::beast::error::timeout ||
           ec == boost::asio::error::connection_aborted ||
           ec == boost::asio::error::try_again ||
           ec == boost::asio::error::would_block;
  }

  /**
   * @brief 获取错误的严重程度
   */
  static std::string getErrorSeverity(const boost::beast::error_code& ec) {
    if (isClientDisconnect(ec)) {
      return "info";  // 客户端断开是正常的生命周期事件
    }
    if (isRetryableError(ec)) {
      return "warning";
    }
    return "error";
  }
};

/**
 * @brief 网络错误记录器
 */
class ErrorLogger {
 public:
  /**
   * @brief 按严重程度记录网络错误
   */
  static void logNetworkError(const NetworkContext& ctx,
                              const boost::beast::error_code& ec,
                              const std::string& additional_info = "") {
    const auto severity = ErrorHelper::getErrorSeverity(ec);
    if (severity == "info") {
      LOG_INFO << "Client disconnected during " << ctx.operation << ": "
               << ctx.endpoint
               << (ctx.username.empty() ? "" : " (" + ctx.username + ")");
      return;
    }

    const auto level = severity == "warning" ? ::logger::LogLevel::WARNING
                                             : ::logger::LogLevel::ERROR;
    LOG_MODULE("network", level)
        << "Network error in " << ctx.operation
        << " operation - Endpoint: " << ctx.endpoint << ", Connection: "
        << (ctx.connection_id.empty() ? "pending" : ctx.connection_id)
        << ", Duration: " << ctx.elapsed().count() << "ms"
        << ", Bytes: " << ctx.bytes_transferred << ", Error: " << ec.message()
        << (additional_info.empty() ? "" : ", Info: " + additional_info);
  }

  /**
   * @brief 记录性能警告
   */
  static void logPerformanceWarning(const NetworkContext& ctx,
                                    const std::string& metric,
                                    const std::string& threshold_info) {
    LOG_WARNING << "Performance warning in " << ctx.operation << " - "
                << metric << ", Threshold: " << threshold_info
                << ", Endpoint: " << ctx.endpoint;
  }

  /**
   * @brief 记录耗时较长的成功操作
   */
  static void logOperationSuccess(const NetworkContext& ctx) {
    const auto duration_ms = ctx.elapsed();
    if (duration_ms.count() > 100) {
      LOG_INFO << "Long operation completed: " << ctx.operation
               << ", Duration: " << duration_ms.count() << "ms"
               << ", Bytes: " << ctx.bytes_transferred
               << ", Connection: " << ctx.connection_id;
    }
  }
};

}  // namespace mayhem::network
