#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <string>
#include <thread>

#include "common/config_manager.hpp"
#include "common/logging.hpp"
#include "server.hpp"

// 用于优雅地处理Ctrl+C信号
static std::atomic<bool> g_stop_signal(false);

void signal_handler(const int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_stop_signal = true;
  }
}

auto main(const int argc, char* argv[]) -> int {
  const std::string config_path = argc > 1 ? argv[1] : "config/server.json";

  // 加载配置
  mayhem::common::ConfigManager config;
  auto config_result = config.loadFromFile(config_path);

  logger::Logger::InitFrom(argv[0], config);
  if (!config_result.has_value()) {
    LOG_WARNING << "配置文件加载失败，使用默认配置: "
                << config_result.error().message;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  LOG_INFO << "Mayhem Server Starting...";

  try {
    mayhem::server::Server server(config);
    server.start();
    LOG_INFO << "Server started successfully. Press Ctrl+C to exit.";

    while (!g_stop_signal) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOG_INFO << "Caught shutdown signal, shutting down...";
    server.stop();
  } catch (const std::exception& e) {
    LOG_ERROR << "Failed to start: " << e.what();
    logger::Logger::shutdown();
    return 1;
  }

  LOG_INFO << "Shutdown complete.";
  logger::Logger::shutdown();
  return 0;
}
