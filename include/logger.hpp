#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace logguard {

// Transparent hasher so context maps accept string_view lookups
struct TransparentStringHash {
  using is_transparent = void;

  template <typename StringType>
  std::size_t operator()(const StringType &str) const {
    return std::hash<std::string_view>{}(str);
  }
};

using LogContext = std::unordered_map<std::string, std::string,
                                      TransparentStringHash, std::equal_to<>>;
using ComponentSet =
    std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>;

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  std::string logFile = "logs/logguard.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  ComponentSet componentFilter; // Empty = all components
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};
  std::chrono::steady_clock::time_point startTime;

  LogMetrics() : startTime(std::chrono::steady_clock::now()) {}

  // Atomics are not copyable, copy their current values instead
  LogMetrics(const LogMetrics &other)
      : totalMessages(other.totalMessages.load()),
        errorCount(other.errorCount.load()),
        warningCount(other.warningCount.load()), startTime(other.startTime) {}

  LogMetrics &operator=(const LogMetrics &other) {
    if (this != &other) {
      totalMessages.store(other.totalMessages.load());
      errorCount.store(other.errorCount.load());
      warningCount.store(other.warningCount.load());
      startTime = other.startTime;
    }
    return *this;
  }
};

class Logger {
public:
  static Logger &getInstance();

  // Configuration methods
  void configure(const LogConfig &config);

  // Logging methods
  void log(LogLevel level, const std::string &component,
           const std::string &message, const LogContext &context = {});
  void debug(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void info(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void warn(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void error(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void fatal(const std::string &component, const std::string &message,
             const LogContext &context = {});

  // Performance logging
  void logPerformance(const std::string &operation, double durationMs,
                      const LogContext &context = {});
  LogMetrics getMetrics() const;

  // Control methods
  void flush();
  void shutdown();

  static std::string levelToString(LogLevel level);

private:
  Logger() = default;
  ~Logger();

  LogConfig config_;
  mutable std::mutex configMutex_;

  std::ofstream fileStream_;
  std::string currentLogFile_;
  size_t currentFileSize_ = 0;
  mutable std::mutex fileMutex_;

  LogMetrics metrics_;

  std::string formatTimestamp() const;
  std::string formatMessage(const LogConfig &config, LogLevel level,
                            const std::string &component,
                            const std::string &message,
                            const LogContext &context) const;
  std::string formatTextMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  std::string formatJsonMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  void writeLog(const LogConfig &config, const std::string &formattedMessage);
  bool openLogFileLocked(const std::string &filename);
  void rotateLogFileLocked(const LogConfig &config);
  bool shouldLog(const LogConfig &config, LogLevel level,
                 const std::string &component) const;
  LogConfig snapshotConfig() const;
};

} // namespace logguard
