#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

#include "common/config_manager.hpp"
#include "common/logging.hpp"

class LoggingTest : public testing::Test {
 protected:
  void SetUp() override {
    temp_log_dir_ =
        std::filesystem::temp_directory_path() / "mayhem_logging_test";
    std::filesystem::create_directories(temp_log_dir_);

    test_config_.global_level = logger::LogLevel::DEBUG;
    test_config_.file_enabled = true;
    test_config_.console_enabled = false;
    test_config_.log_directory = temp_log_dir_.string();
    test_config_.filename_pattern = "{program}.log";
    test_config_.max_file_size_mb = 1;
    test_config_.max_files = 3;
    test_config_.auto_flush = true;
    test_config_.format_pattern = "[{level}] {message}";
  }

  void TearDown() override {
    logger::Logger::shutdown();
    std::filesystem::remove_all(temp_log_dir_);

    // 恢复测试进程的默认日志配置
    logger::LogConfig restored;
    restored.file_enabled = false;
    restored.console_enabled = true;
    restored.console_min_level = logger::LogLevel::WARNING;
    logger::Logger::Init("mayhem_tests", restored);
  }

  std::string readLog(const std::string& program) const {
    std::ifstream file(temp_log_dir_ / (program + ".log"));
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
  }

  static bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
  }

  std::filesystem::path temp_log_dir_;
  logger::LogConfig test_config_;
};

/**
 * @brief 测试文件输出与程序名
 */
TEST_F(LoggingTest, WritesToProgramLogFile) {
  // 路径前缀会被去掉
  logger::Logger::Init("/usr/bin/mayhem_server", test_config_);
  LOG_INFO << "Lobby ABC123 created by alice";
  logger::Logger::flush();

  const auto content = readLog("mayhem_server");
  EXPECT_TRUE(contains(content, "[INFO] Lobby ABC123 created by alice"));
}

/**
 * @brief 测试日志级别过滤
 */
TEST_F(LoggingTest, LevelFiltering) {
  test_config_.global_level = logger::LogLevel::WARNING;
  logger::Logger::Init("level_filter", test_config_);

  LOG_DEBUG << "debug line";
  LOG_INFO << "info line";
  LOG_WARNING << "warning line";
  LOG_ERROR << "error line";
  logger::Logger::flush();

  const auto content = readLog("level_filter");
  EXPECT_FALSE(contains(content, "debug line"));
  EXPECT_FALSE(contains(content, "info line"));
  EXPECT_TRUE(contains(content, "[WARN] warning line"));
  EXPECT_TRUE(contains(content, "[ERROR] error line"));
}

/**
 * @brief 测试模块级别覆盖全局级别
 */
TEST_F(LoggingTest, ModuleLevels) {
  test_config_.global_level = logger::LogLevel::INFO;
  test_config_.module_levels["network"] = logger::LogLevel::DEBUG;
  test_config_.module_levels["tournament"] = logger::LogLevel::ERROR;
  logger::Logger::Init("module_levels", test_config_);

  LOG_MODULE("network", logger::LogLevel::DEBUG) << "frame received";
  LOG_MODULE("tournament", logger::LogLevel::INFO) << "round started";
  LOG_MODULE("tournament", logger::LogLevel::ERROR) << "timer failed";
  LOG_DEBUG << "default debug";
  logger::Logger::flush();

  const auto content = readLog("module_levels");
  EXPECT_TRUE(contains(content, "frame received"));
  EXPECT_FALSE(contains(content, "round started"));
  EXPECT_TRUE(contains(content, "timer failed"));
  EXPECT_FALSE(contains(content, "default debug"));
  EXPECT_EQ(logger::Logger::getEffectiveLevel("network"),
            logger::LogLevel::DEBUG);
  EXPECT_EQ(logger::Logger::getEffectiveLevel(), logger::LogLevel::INFO);
}

/**
 * @brief 测试条件日志
 */
TEST_F(LoggingTest, ConditionalLogging) {
  logger::Logger::Init("conditional", test_config_);

  LOG_IF_INFO(true) << "kept";
  LOG_IF_INFO(false) << "dropped";
  logger::Logger::flush();

  const auto content = readLog("conditional");
  EXPECT_TRUE(contains(content, "kept"));
  EXPECT_FALSE(contains(content, "dropped"));
}

/**
 * @brief 测试运行时调整级别
 */
TEST_F(LoggingTest, DynamicLevelAdjustment) {
  logger::Logger::Init("dynamic", test_config_);

  LOG_DEBUG << "before";
  logger::Logger::setGlobalLevel(logger::LogLevel::ERROR);
  LOG_DEBUG << "after";
  logger::Logger::setModuleLevel("lobby", logger::LogLevel::DEBUG);
  LOG_MODULE("lobby", logger::LogLevel::DEBUG) << "lobby detail";
  logger::Logger::flush();

  const auto content = readLog("dynamic");
  EXPECT_TRUE(contains(content, "before"));
  EXPECT_FALSE(contains(content, "after"));
  EXPECT_TRUE(contains(content, "lobby detail"));
}

/**
 * @brief 测试内存输出流与回调
 */
TEST_F(LoggingTest, MemoryStreamAndCallback) {
  test_config_.file_enabled = false;
  logger::Logger::Init("memory", test_config_);

  auto memory_stream = std::make_unique<logger::MemoryLogStream>(3);
  auto* memory = memory_stream.get();
  logger::Logger::addOutputStream(std::move(memory_stream));

  std::vector<logger::LogLevel> seen;
  logger::Logger::setLogCallback(
      [&seen](const logger::LogEntry& entry) { seen.push_back(entry.level); });

  for (int i = 0; i < 5; ++i) {
    LOG_INFO << "message " << i;
  }
  LOG_WARNING << "last";

  auto entries = memory->getEntries();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_TRUE(contains(entries.back(), "[WARN] last"));
  EXPECT_EQ(seen.size(), 6u);
  EXPECT_EQ(seen.back(), logger::LogLevel::WARNING);

  memory->clear();
  EXPECT_TRUE(memory->getEntries().empty());
}

/**
 * @brief 测试从配置文件读取日志配置
 */
TEST_F(LoggingTest, LoadFromConfigManager) {
  mayhem::common::ConfigManager config;
  ASSERT_TRUE(config
                  .loadFromJson({{"logging",
                                  {{"level", "debug"},
                                   {"console_enabled", true},
                                   {"file", {{"directory", "/tmp/mayhem"},
                                             {"max_files", 4}}},
                                   {"console", {{"min_level", "ERROR"}}},
                                   {"module_levels", {{"network", "TRACE"}}}}}})
                  .has_value());

  auto log_config = logger::LogConfig::loadFrom(config);
  EXPECT_EQ(log_config.global_level, logger::LogLevel::DEBUG);
  EXPECT_TRUE(log_config.console_enabled);
  EXPECT_TRUE(log_config.file_enabled);
  EXPECT_EQ(log_config.log_directory, "/tmp/mayhem");
  EXPECT_EQ(log_config.max_files, 4u);
  EXPECT_EQ(log_config.console_min_level, logger::LogLevel::ERROR);
  EXPECT_EQ(log_config.module_levels.at("network"), logger::LogLevel::TRACE);
}

/**
 * @brief 测试环境变量覆盖
 */
TEST_F(LoggingTest, EnvironmentOverrides) {
  setenv("MAYHEM_LOG_LEVEL", "error", 1);
  setenv("MAYHEM_LOG_DIR", "/tmp/mayhem_env_logs", 1);
  setenv("MAYHEM_LOG_CONSOLE", "1", 1);

  logger::LogConfig log_config;
  log_config.applyEnvironmentOverrides();

  unsetenv("MAYHEM_LOG_LEVEL");
  unsetenv("MAYHEM_LOG_DIR");
  unsetenv("MAYHEM_LOG_CONSOLE");

  EXPECT_EQ(log_config.global_level, logger::LogLevel::ERROR);
  EXPECT_EQ(log_config.log_directory, "/tmp/mayhem_env_logs");
  EXPECT_TRUE(log_config.console_enabled);
}

/**
 * @brief 测试多线程写入
 */
TEST_F(LoggingTest, ConcurrentWriters) {
  logger::Logger::Init("concurrent", test_config_);

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t] {
      for (int i = 0; i < 100; ++i) {
        LOG_INFO << "worker " << t << " line " << i;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  logger::Logger::flush();

  const auto content = readLog("concurrent");
  std::size_t lines = 0;
  for (char c : content) {
    if (c == '\n') {
      ++lines;
    }
  }
  EXPECT_EQ(lines, 400u);
}
