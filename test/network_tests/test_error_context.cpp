#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/websocket/error.hpp>
#include <thread>

#include "network/error_context.hpp"

using namespace mayhem::network;
namespace beast = boost::beast;
namespace asio = boost::asio;

TEST(ErrorContextTest, NetworkContextStartsEmpty) {
  const NetworkContext ctx("read", "127.0.0.1:8000");

  EXPECT_EQ(ctx.operation, "read");
  EXPECT_EQ(ctx.endpoint, "127.0.0.1:8000");
  EXPECT_TRUE(ctx.connection_id.empty());
  EXPECT_TRUE(ctx.username.empty());
  EXPECT_EQ(ctx.bytes_transferred, 0u);
}

TEST(ErrorContextTest, ElapsedTimeGrows) {
  const NetworkContext ctx("handshake", "10.0.0.1:1234");
  std::this_thread::sleep_for(std::chrono::milliseconds(15));
  EXPECT_GE(ctx.elapsed().count(), 10);
}

TEST(ErrorContextTest, ClosedConnectionsAreDisconnects) {
  for (const beast::error_code ec :
       {beast::error_code(beast::websocket::error::closed),
        beast::error_code(beast::http::error::end_of_stream),
        beast::error_code(asio::error::connection_reset),
        beast::error_code(asio::error::eof)}) {
    EXPECT_TRUE(ErrorHelper::isClientDisconnect(ec)) << ec.message();
    EXPECT_FALSE(ErrorHelper::isRetryableError(ec)) << ec.message();
    EXPECT_EQ(ErrorHelper::getErrorSeverity(ec), "info");
  }
}

TEST(ErrorContextTest, TransientErrorsAreRetryable) {
  for (const beast::error_code ec :
       {beast::error_code(beast::error::timeout),
        beast::error_code(asio::error::connection_aborted),
        beast::error_code(asio::error::try_again),
        beast::error_code(asio::error::would_block)}) {
    EXPECT_TRUE(ErrorHelper::isRetryableError(ec)) << ec.message();
    EXPECT_FALSE(ErrorHelper::isClientDisconnect(ec)) << ec.message();
    EXPECT_EQ(ErrorHelper::getErrorSeverity(ec), "warning");
  }
}

TEST(ErrorContextTest, OtherErrorsAreSevere) {
  const beast::error_code unsupported = asio::error::operation_not_supported;
  EXPECT_EQ(ErrorHelper::getErrorSeverity(unsupported), "error");

  const beast::error_code refused = asio::error::connection_refused;
  EXPECT_EQ(ErrorHelper::getErrorSeverity(refused), "error");
}

TEST(ErrorContextTest, UnconnectedSocketHasUnknownEndpoint) {
  asio::io_context ioc;
  asio::ip::tcp::socket socket(ioc);
  EXPECT_EQ(describeEndpoint(socket), "unknown");
}

TEST(ErrorContextTest, LoggingNeverThrows) {
  NetworkContext ctx("write", "127.0.0.1:9");
  ctx.connection_id = "conn-1";
  ctx.username = "alice";
  ctx.bytes_transferred = 42;

  EXPECT_NO_THROW(ErrorLogger::logNetworkError(
      ctx, beast::error_code(asio::error::eof)));
  EXPECT_NO_THROW(ErrorLogger::logNetworkError(
      ctx, beast::error_code(beast::error::timeout), "queue full"));
  EXPECT_NO_THROW(ErrorLogger::logNetworkError(
      ctx, beast::error_code(asio::error::access_denied)));
  EXPECT_NO_THROW(
      ErrorLogger::logPerformanceWarning(ctx, "queue size 1024", "1024"));
  EXPECT_NO_THROW(ErrorLogger::logOperationSuccess(ctx));
}
