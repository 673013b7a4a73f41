#pragma once

#include "ledgerguard/string_hash.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace ledgerguard {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  bool asyncLogging = false;
  std::string logFile = "logs/ledgerguard.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  StringSet componentFilter; // Empty = all components
  size_t maxQueueSize = 10000;
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};
  std::atomic<uint64_t> droppedMessages{0};
  std::chrono::steady_clock::time_point startTime;

  LogMetrics() : startTime(std::chrono::steady_clock::now()) {}

  // Atomics are not copyable, copy their current values instead
  LogMetrics(const LogMetrics &other)
      : totalMessages(other.totalMessages.load()),
        errorCount(other.errorCount.load()),
        warningCount(other.warningCount.load()),
        droppedMessages(other.droppedMessages.load()),
        startTime(other.startTime) {}

  LogMetrics &operator=(const LogMetrics &other) {
    if (this != &other) {
      totalMessages.store(other.totalMessages.load());
      errorCount.store(other.errorCount.load());
      warningCount.store(other.warningCount.load());
      droppedMessages.store(other.droppedMessages.load());
      startTime = other.startTime;
    }
    return *this;
  }
};

/**
 * @brief Process-wide logger with text/JSON formatting, file rotation and an
 * optional background writer.
 */
class Logger {
public:
  static Logger &getInstance();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  // Configuration methods
  void configure(const LogConfig &config);
  void setLogLevel(LogLevel level);
  void setLogFormat(LogFormat format);
  void enableConsoleOutput(bool enable);
  void setComponentFilter(const StringSet &components);
  LogConfig getConfig() const;

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

  LogMetrics getMetrics() const;

  // Formatting is public so sinks other than the logger can reuse it
  std::string formatMessage(LogLevel level, const std::string &component,
                            const std::string &message,
                            const LogContext &context) const;
  static std::string levelToString(LogLevel level);
  static std::string escapeJson(const std::string &str);

  // Control methods
  void flush();
  void shutdown();

private:
  Logger() = default;
  ~Logger();

  LogConfig config_;
  mutable std::mutex configMutex_;

  // File handling
  std::ofstream fileStream_;
  size_t currentFileSize_ = 0;
  std::mutex fileMutex_;

  // Async logging
  std::queue<std::string> messageQueue_;
  std::thread asyncThread_;
  std::condition_variable asyncCondition_;
  std::mutex asyncMutex_;
  std::atomic<bool> stopAsync_{false};
  std::atomic<bool> asyncStarted_{false};

  LogMetrics metrics_;

  static std::string formatTimestamp();
  std::string formatTextMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  std::string formatJsonMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  void openLogFile(const std::string &filename);
  void writeLog(const std::string &formattedMessage);
  void writeLogSync(const std::string &formattedMessage);
  void writeLogAsync(const std::string &formattedMessage);
  void startAsyncWorker();
  void stopAsyncWorker();
  void asyncWorker();
  void rotateLogFile();
  bool shouldLog(LogLevel level, const std::string &component) const;
};

} // namespace ledgerguard

#define LEDGERGUARD_LOG_DEBUG(component, message, ...)                         \
  ::ledgerguard::Logger::getInstance().debug(component, message, ##__VA_ARGS__)
#define LEDGERGUARD_LOG_INFO(component, message, ...)                          \
  ::ledgerguard::Logger::getInstance().info(component, message, ##__VA_ARGS__)
#define LEDGERGUARD_LOG_WARN(component, message, ...)                          \
  ::ledgerguard::Logger::getInstance().warn(component, message, ##__VA_ARGS__)
#define LEDGERGUARD_LOG_ERROR(component, message, ...)                         \
  ::ledgerguard::Logger::getInstance().error(component, message, ##__VA_ARGS__)
#define LEDGERGUARD_LOG_FATAL(component, message, ...)                         \
  ::ledgerguard::Logger::getInstance().fatal(component, message, ##__VA_ARGS__)

#include "ledgerguard/component_logger.hpp"
