#pragma once

/**
 * @file logging.hpp
 * @brief 服务器日志：按级别与模块过滤，输出到文件、控制台或内存
 *
 * 用法：LOG_INFO << "Lobby " << code << " created";
 *       LOG_MODULE("network", logger::LogLevel::DEBUG) << "...";
 */

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace mayhem::common {
class ConfigManager;
}

namespace logger {

enum class LogLevel : std::uint8_t { TRACE = 0, DEBUG, INFO, WARNING, ERROR, FATAL };

auto levelName(LogLevel level) -> const char*;

/**
 * @brief 一条已采集的日志
 */
struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level = LogLevel::INFO;
  std::string file;
  int line = 0;
  std::string function;
  std::thread::id thread_id;
  std::string module;
  std::string message;
};

/**
 * @brief 日志配置，对应配置文件中的 logging.* 键
 */
struct LogConfig {
  LogLevel global_level = LogLevel::INFO;
  bool file_enabled = true;
  bool console_enabled = false;

  // 文件输出
  std::string log_directory = "./logs";
  std::string filename_pattern = "{program}.log";
  size_t max_file_size_mb = 10;
  size_t max_files = 10;
  bool auto_flush = true;

  // 控制台输出
  bool console_colored = true;
  LogLevel console_min_level = LogLevel::WARNING;

  // 占位符：{timestamp} {level} {location} {function} {thread} {module} {message}
  std::string format_pattern = "[{timestamp}] [{level}] [{location}] {message}";

  std::map<std::string, LogLevel> module_levels;

  static LogConfig loadFrom(const mayhem::common::ConfigManager& config);

  // MAYHEM_LOG_LEVEL / MAYHEM_LOG_DIR / MAYHEM_LOG_CONSOLE / MAYHEM_LOG_COLORED
  void applyEnvironmentOverrides();

  // 不区分大小写，未知名称返回 INFO
  static LogLevel parseLogLevel(const std::string& level_str);
};

/**
 * @brief 日志输出目标
 */
class LogOutputStream {
 public:
  virtual ~LogOutputStream() = default;
  virtual void write(const LogEntry& entry, const std::string& formatted) = 0;
  virtual void flush() = 0;
  virtual bool shouldLog(LogLevel /*level*/) const { return true; }
};

/**
 * @brief 把格式串预编译为片段列表
 */
class LogFormatter {
 public:
  explicit LogFormatter(const std::string& pattern);
  std::string format(const LogEntry& entry) const;

 private:
  using Piece = std::function<void(const LogEntry&, std::string&)>;
  std::vector<Piece> pieces_;
};

/**
 * @brief 按大小轮转的日志文件
 *
 * 超过上限时 name.log 依次改名为 name.log.1 ... name.log.N，最旧的被删除。
 */
class FileLogStream : public LogOutputStream {
 public:
  FileLogStream(const std::string& directory,
                const std::string& filename_pattern, size_t max_size_mb,
                size_t max_files, bool auto_flush,
                const std::string& program_name);

  void write(const LogEntry& entry, const std::string& formatted) override;
  void flush() override;

 private:
  void openFile();
  void rotate();

  std::string path_;
  size_t max_bytes_;
  size_t max_files_;
  bool auto_flush_;

  std::ofstream file_;
  size_t written_ = 0;
  std::mutex mutex_;
};

/**
 * @brief 标准错误输出，可选ANSI颜色
 */
class ConsoleLogStream : public LogOutputStream {
 public:
  ConsoleLogStream(bool colored, LogLevel min_level);

  void write(const LogEntry& entry, const std::string& formatted) override;
  void flush() override;
  bool shouldLog(LogLevel level) const override { return level >= min_level_; }

 private:
  bool colored_;
  LogLevel min_level_;
  std::mutex mutex_;
};

/**
 * @brief 保留最近若干条格式化结果（用于测试）
 */
class MemoryLogStream : public LogOutputStream {
 public:
  explicit MemoryLogStream(size_t max_entries = 1000);

  void write(const LogEntry& entry, const std::string& formatted) override;
  void flush() override {}

  std::vector<std::string> getEntries() const;
  void clear();

 private:
  size_t max_entries_;
  std::vector<std::string> entries_;
  mutable std::mutex mutex_;
};

/**
 * @brief 进程级日志器
 *
 * 在 Init 之前与 shutdown 之后，所有日志都被丢弃。
 */
class Logger {
 public:
  static void Init(const std::string& program_name, const LogConfig& config);
  static void InitFrom(const std::string& program_name,
                       const mayhem::common::ConfigManager& config);

  static void addOutputStream(std::unique_ptr<LogOutputStream> stream);

  static void setGlobalLevel(LogLevel level);
  static void setModuleLevel(const std::string& module, LogLevel level);
  static LogLevel getEffectiveLevel(const std::string& module = "");

  // 每条写出的日志都会在锁外回调一次
  static void setLogCallback(std::function<void(const LogEntry&)> callback);

  static void flush();
  static void shutdown();

  static bool shouldLog(LogLevel level, const std::string& module = "");
  static void log(LogLevel level, const char* file, int line,
                  const char* function, const std::string& message,
                  const std::string& module = "");

  /**
   * @brief 析构时提交的一条日志
   */
  class LogStream {
   public:
    LogStream(const char* file, int line, const char* function, LogLevel level,
              std::string module = "", bool condition = true);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& value) {
      if (enabled_) {
        stream_ << value;
      }
      return *this;
    }

   private:
    std::ostringstream stream_;
    const char* file_;
    int line_;
    const char* function_;
    LogLevel level_;
    std::string module_;
    bool enabled_;
  };

 private:
  Logger() = default;
  static Logger& instance();

  auto levelForNoLock(const std::string& module) const -> LogLevel;

  bool initialized_ = false;
  LogLevel global_level_ = LogLevel::INFO;
  std::map<std::string, LogLevel> module_levels_;
  std::unique_ptr<LogFormatter> formatter_;
  std::vector<std::unique_ptr<LogOutputStream>> streams_;
  std::function<void(const LogEntry&)> callback_;
  mutable std::mutex mutex_;
};

#define LOG_AT(level) \
  ::logger::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, level)

#define LOG_TRACE LOG_AT(::logger::LogLevel::TRACE)
#define LOG_DEBUG LOG_AT(::logger::LogLevel::DEBUG)
#define LOG_INFO LOG_AT(::logger::LogLevel::INFO)
#define LOG_WARNING LOG_AT(::logger::LogLevel::WARNING)
#define LOG_ERROR LOG_AT(::logger::LogLevel::ERROR)
#define LOG_FATAL LOG_AT(::logger::LogLevel::FATAL)

#define LOG_MODULE(module, level) \
  ::logger::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, level, module)

#define LOG_IF_INFO(condition)                                  \
  ::logger::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                              ::logger::LogLevel::INFO, "", condition)

}  // namespace logger
