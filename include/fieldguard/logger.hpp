#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fieldguard {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

using LogContext = std::unordered_map<std::string, std::string>;

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  std::string logFile = "logs/fieldguard.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  std::unordered_set<std::string> componentFilter; // Empty = all components
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};
  std::chrono::steady_clock::time_point startTime;

  LogMetrics() : startTime(std::chrono::steady_clock::now()) {}

  // Copy constructor - can't copy atomics directly, so copy their values
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

// A single emitted log entry as delivered to listeners
struct LogRecord {
  LogLevel level;
  std::string component;
  std::string message;
  LogContext context;
  std::string formatted;
};

using LogListener = std::function<void(const LogRecord &)>;

class Logger {
public:
  static Logger &getInstance();

  // Configuration methods
  void configure(const LogConfig &config);
  void setLogLevel(LogLevel level);
  void setLogFormat(LogFormat format);
  void enableConsoleOutput(bool enable);
  void setComponentFilter(const std::unordered_set<std::string> &components);
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

  /**
   * @brief Register a callback receiving every record that passes filtering
   * @return Handle for removeListener
   */
  size_t addListener(LogListener listener);
  void removeListener(size_t handle);
  void clearListeners();

  LogMetrics getMetrics() const;

  // Control methods
  void flush();
  void shutdown();

  static std::string levelToString(LogLevel level);
  static LogLevel parseLogLevel(const std::string &levelStr);
  static LogFormat parseLogFormat(const std::string &formatStr);

private:
  Logger() = default;
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  LogConfig config_;
  mutable std::mutex configMutex_;

  // File handling
  std::ofstream fileStream_;
  size_t currentFileSize_ = 0;
  std::mutex fileMutex_;

  // Console and listeners
  std::mutex outputMutex_;
  std::vector<std::pair<size_t, LogListener>> listeners_;
  size_t nextListenerHandle_ = 1;

  LogMetrics metrics_;

  std::string formatTimestamp() const;
  std::string formatTextMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  std::string formatJsonMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  void openLogFile(const std::string &filename);
  void writeToFile(const std::string &formattedMessage,
                   const LogConfig &config);
  void rotateLogFile(const LogConfig &config);
};

} // namespace fieldguard

// Standard logging macros
#define FG_LOG_DEBUG(component, message, ...)                                  \
  fieldguard::Logger::getInstance().debug(component, message, ##__VA_ARGS__)
#define FG_LOG_INFO(component, message, ...)                                   \
  fieldguard::Logger::getInstance().info(component, message, ##__VA_ARGS__)
#define FG_LOG_WARN(component, message, ...)                                   \
  fieldguard::Logger::getInstance().warn(component, message, ##__VA_ARGS__)
#define FG_LOG_ERROR(component, message, ...)                                  \
  fieldguard::Logger::getInstance().error(component, message, ##__VA_ARGS__)
#define FG_LOG_FATAL(component, message, ...)                                  \
  fieldguard::Logger::getInstance().fatal(component, message, ##__VA_ARGS__)

#include "fieldguard/component_logger.hpp"
