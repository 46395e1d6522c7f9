#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

#include "common/config_manager.hpp"

namespace logger {

namespace {

auto envFlag(const char* value) -> bool {
  const std::string flag(value);
  return flag == "true" || flag == "1";
}

auto colorCode(LogLevel level) -> const char* {
  switch (level) {
    case LogLevel::TRACE:
      return "\033[37m";
    case LogLevel::DEBUG:
      return "\033[36m";
    case LogLevel::INFO:
      return "\033[32m";
    case LogLevel::WARNING:
      return "\033[33m";
    case LogLevel::ERROR:
      return "\033[31m";
    case LogLevel::FATAL:
      return "\033[35m";
  }
  return "";
}

void appendTimestamp(const LogEntry& entry, std::string& out) {
  const auto time = std::chrono::system_clock::to_time_t(entry.timestamp);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      entry.timestamp.time_since_epoch())
                      .count() %
                  1000;
  std::tm local_tm{};
  localtime_r(&time, &local_tm);

  std::ostringstream oss;
  oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << ms;
  out += oss.str();
}

}  // namespace

auto levelName(LogLevel level) -> const char* {
  switch (level) {
    case LogLevel::TRACE:
      return "TRACE";
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
  }
  return "UNKN";
}

//------------------------------------------------------------------------------
// LogConfig

LogConfig LogConfig::loadFrom(const mayhem::common::ConfigManager& config) {
  LogConfig result;
  result.global_level = parseLogLevel(
      config.getWithDefault<std::string>("logging.level", "INFO"));
  result.file_enabled =
      config.getWithDefault<bool>("logging.file_enabled", result.file_enabled);
  result.console_enabled = config.getWithDefault<bool>(
      "logging.console_enabled", result.console_enabled);

  result.log_directory = config.getWithDefault<std::string>(
      "logging.file.directory", result.log_directory);
  result.filename_pattern = config.getWithDefault<std::string>(
      "logging.file.filename_pattern", result.filename_pattern);
  result.max_file_size_mb = static_cast<size_t>(std::max(
      1, config.getWithDefault<int>("logging.file.max_size_mb", 10)));
  result.max_files = static_cast<size_t>(
      std::max(1, config.getWithDefault<int>("logging.file.max_files", 10)));
  result.auto_flush =
      config.getWithDefault<bool>("logging.file.auto_flush", result.auto_flush);

  result.console_colored = config.getWithDefault<bool>(
      "logging.console.colored", result.console_colored);
  result.console_min_level = parseLogLevel(
      config.getWithDefault<std::string>("logging.console.min_level", "INFO"));

  result.format_pattern = config.getWithDefault<std::string>(
      "logging.format.pattern", result.format_pattern);

  const auto root = config.getConfig();
  const auto logging = root.find("logging");
  if (logging != root.end() && logging->is_object()) {
    const auto modules = logging->find("module_levels");
    if (modules != logging->end() && modules->is_object()) {
      for (const auto& [module, level] : modules->items()) {
        if (level.is_string()) {
          result.module_levels[module] =
              parseLogLevel(level.get<std::string>());
        }
      }
    }
  }
  return result;
}

void LogConfig::applyEnvironmentOverrides() {
  if (const char* level = std::getenv("MAYHEM_LOG_LEVEL")) {
    global_level = parseLogLevel(level);
  }
  if (const char* directory = std::getenv("MAYHEM_LOG_DIR")) {
    log_directory = directory;
  }
  if (const char* console = std::getenv("MAYHEM_LOG_CONSOLE")) {
    console_enabled = envFlag(console);
  }
  if (const char* colored = std::getenv("MAYHEM_LOG_COLORED")) {
    console_colored = envFlag(colored);
  }
}

LogLevel LogConfig::parseLogLevel(const std::string& level_str) {
  std::string upper = level_str;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "TRACE") return LogLevel::TRACE;
  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
  if (upper == "ERROR") return LogLevel::ERROR;
  if (upper == "FATAL") return LogLevel::FATAL;
  return LogLevel::INFO;
}

//------------------------------------------------------------------------------
// LogFormatter

LogFormatter::LogFormatter(const std::string& pattern) {
  std::string literal;
  auto flushLiteral = [&] {
    if (!literal.empty()) {
      pieces_.push_back([text = literal](const LogEntry&, std::string& out) {
        out += text;
      });
      literal.clear();
    }
  };

  size_t pos = 0;
  while (pos < pattern.size()) {
    const auto open = pattern.find('{', pos);
    const auto close =
        open == std::string::npos ? open : pattern.find('}', open);
    if (close == std::string::npos) {
      literal += pattern.substr(pos);
      break;
    }
    literal += pattern.substr(pos, open - pos);
    const auto name = pattern.substr(open + 1, close - open - 1);
    pos = close + 1;

    Piece piece;
    if (name == "timestamp") {
      piece = appendTimestamp;
    } else if (name == "level") {
      piece = [](const LogEntry& e, std::string& out) { out += levelName(e.level); };
    } else if (name == "location") {
      piece = [](const LogEntry& e, std::string& out) {
        out += std::filesystem::path(e.file).filename().string();
        out += ':';
        out += std::to_string(e.line);
      };
    } else if (name == "function") {
      piece = [](const LogEntry& e, std::string& out) { out += e.function; };
    } else if (name == "thread") {
      piece = [](const LogEntry& e, std::string& out) {
        std::ostringstream oss;
        oss << e.thread_id;
        out += oss.str();
      };
    } else if (name == "module") {
      piece = [](const LogEntry& e, std::string& out) {
        if (!e.module.empty()) {
          out += "[" + e.module + "]";
        }
      };
    } else if (name == "message") {
      piece = [](const LogEntry& e, std::string& out) { out += e.message; };
    } else {
      // 未知占位符原样保留
      literal += "{" + name + "}";
      continue;
    }
    flushLiteral();
    pieces_.push_back(std::move(piece));
  }
  flushLiteral();
}

std::string LogFormatter::format(const LogEntry& entry) const {
  std::string out;
  out.reserve(128 + entry.message.size());
  for (const auto& piece : pieces_) {
    piece(entry, out);
  }
  return out;
}

//------------------------------------------------------------------------------
// FileLogStream

FileLogStream::FileLogStream(const std::string& directory,
                             const std::string& filename_pattern,
                             size_t max_size_mb, size_t max_files,
                             bool auto_flush, const std::string& program_name)
    : max_bytes_(max_size_mb * 1024 * 1024),
      max_files_(std::max<size_t>(max_files, 1)),
      auto_flush_(auto_flush) {
  std::string filename = filename_pattern;
  const auto pos = filename.find("{program}");
  if (pos != std::string::npos) {
    filename.replace(pos, 9, program_name);
  }

  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  path_ = (std::filesystem::path(directory) / filename).string();
  openFile();
}

void FileLogStream::openFile() {
  file_.open(path_, std::ios::app);
  std::error_code ec;
  const auto size = std::filesystem::file_size(path_, ec);
  written_ = ec ? 0 : static_cast<size_t>(size);
}

void FileLogStream::write(const LogEntry& /*entry*/,
                          const std::string& formatted) {
  std::lock_guard lock(mutex_);
  if (!file_.is_open()) {
    return;
  }

  file_ << formatted << '\n';
  written_ += formatted.size() + 1;
  if (auto_flush_) {
    file_.flush();
  }
  if (written_ > max_bytes_) {
    rotate();
  }
}

void FileLogStream::flush() {
  std::lock_guard lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  }
}

// 调用者已持有 mutex_
void FileLogStream::rotate() {
  file_.close();

  std::error_code ec;
  std::filesystem::remove(path_ + "." + std::to_string(max_files_), ec);
  for (size_t i = max_files_; i > 1; --i) {
    std::filesystem::rename(path_ + "." + std::to_string(i - 1),
                            path_ + "." + std::to_string(i), ec);
  }
  std::filesystem::rename(path_, path_ + ".1", ec);

  openFile();
}

//------------------------------------------------------------------------------
// ConsoleLogStream / MemoryLogStream

ConsoleLogStream::ConsoleLogStream(bool colored, LogLevel min_level)
    : colored_(colored), min_level_(min_level) {}

void ConsoleLogStream::write(const LogEntry& entry,
                             const std::string& formatted) {
  std::lock_guard lock(mutex_);
  if (colored_) {
    std::cerr << colorCode(entry.level) << formatted << "\033[0m\n";
  } else {
    std::cerr << formatted << '\n';
  }
}

void ConsoleLogStream::flush() {
  std::lock_guard lock(mutex_);
  std::cerr.flush();
}

MemoryLogStream::MemoryLogStream(size_t max_entries)
    : max_entries_(max_entries) {}

void MemoryLogStream::write(const LogEntry& /*entry*/,
                            const std::string& formatted) {
  std::lock_guard lock(mutex_);
  entries_.push_back(formatted);
  if (entries_.size() > max_entries_) {
    entries_.erase(entries_.begin());
  }
}

std::vector<std::string> MemoryLogStream::getEntries() const {
  std::lock_guard lock(mutex_);
  return entries_;
}

void MemoryLogStream::clear() {
  std::lock_guard lock(mutex_);
  entries_.clear();
}

//------------------------------------------------------------------------------
// Logger

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

void Logger::Init(const std::string& program_name, const LogConfig& config) {
  const auto name = std::filesystem::path(program_name).filename().string();

  std::vector<std::unique_ptr<LogOutputStream>> streams;
  if (config.file_enabled) {
    streams.push_back(std::make_unique<FileLogStream>(
        config.log_directory, config.filename_pattern, config.max_file_size_mb,
        config.max_files, config.auto_flush, name));
  }
  if (config.console_enabled) {
    streams.push_back(std::make_unique<ConsoleLogStream>(
        config.console_colored, config.console_min_level));
  }

  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  self.initialized_ = true;
  self.global_level_ = config.global_level;
  self.module_levels_ = config.module_levels;
  self.formatter_ = std::make_unique<LogFormatter>(config.format_pattern);
  self.streams_ = std::move(streams);
}

void Logger::InitFrom(const std::string& program_name,
                      const mayhem::common::ConfigManager& config) {
  auto log_config = LogConfig::loadFrom(config);
  log_config.applyEnvironmentOverrides();
  Init(program_name, log_config);
}

void Logger::addOutputStream(std::unique_ptr<LogOutputStream> stream) {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  self.streams_.push_back(std::move(stream));
}

void Logger::setGlobalLevel(LogLevel level) {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  self.global_level_ = level;
}

void Logger::setModuleLevel(const std::string& module, LogLevel level) {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  self.module_levels_[module] = level;
}

LogLevel Logger::getEffectiveLevel(const std::string& module) {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  return self.levelForNoLock(module);
}

auto Logger::levelForNoLock(const std::string& module) const -> LogLevel {
  if (!module.empty()) {
    auto it = module_levels_.find(module);
    if (it != module_levels_.end()) {
      return it->second;
    }
  }
  return global_level_;
}

void Logger::setLogCallback(std::function<void(const LogEntry&)> callback) {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  self.callback_ = std::move(callback);
}

void Logger::flush() {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  for (auto& stream : self.streams_) {
    stream->flush();
  }
}

void Logger::shutdown() {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  for (auto& stream : self.streams_) {
    stream->flush();
  }
  self.streams_.clear();
  self.formatter_.reset();
  self.callback_ = nullptr;
  self.initialized_ = false;
}

bool Logger::shouldLog(LogLevel level, const std::string& module) {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  return self.initialized_ && level >= self.levelForNoLock(module);
}

void Logger::log(LogLevel level, const char* file, int line,
                 const char* function, const std::string& message,
                 const std::string& module) {
  LogEntry entry;
  entry.timestamp = std::chrono::system_clock::now();
  entry.level = level;
  entry.file = file;
  entry.line = line;
  entry.function = function;
  entry.thread_id = std::this_thread::get_id();
  entry.module = module;
  entry.message = message;

  auto& self = instance();
  std::function<void(const LogEntry&)> callback;
  {
    std::lock_guard lock(self.mutex_);
    if (!self.initialized_ || level < self.levelForNoLock(module)) {
      return;
    }
    const auto formatted = self.formatter_->format(entry);
    for (auto& stream : self.streams_) {
      if (stream->shouldLog(level)) {
        stream->write(entry, formatted);
      }
    }
    callback = self.callback_;
  }

  if (callback) {
    callback(entry);
  }
}

Logger::LogStream::LogStream(const char* file, int line, const char* function,
                             LogLevel level, std::string module,
                             bool condition)
    : file_(file),
      line_(line),
      function_(function),
      level_(level),
      module_(std::move(module)),
      enabled_(condition && Logger::shouldLog(level, module_)) {}

Logger::LogStream::~LogStream() {
  if (enabled_) {
    Logger::log(level_, file_, line_, function_, stream_.str(), module_);
  }
}

}  // namespace logger
