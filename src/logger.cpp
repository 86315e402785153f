#include "fieldguard/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace fieldguard {

Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::~Logger() { shutdown(); }

void Logger::configure(const LogConfig &config) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_ = config;

  std::lock_guard<std::mutex> fileLock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.close();
  }
  if (config_.fileOutput) {
    openLogFile(config_.logFile);
    if (!fileStream_.is_open()) {
      std::cerr << "Failed to open log file: " << config_.logFile << std::endl;
      config_.fileOutput = false;
    }
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.level = level;
}

void Logger::setLogFormat(LogFormat format) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.format = format;
}

void Logger::enableConsoleOutput(bool enable) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.consoleOutput = enable;
}

void Logger::setComponentFilter(
    const std::unordered_set<std::string> &components) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.componentFilter = components;
}

LogConfig Logger::getConfig() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return config_;
}

void Logger::log(LogLevel level, const std::string &component,
                 const std::string &message, const LogContext &context) {
  LogConfig config = getConfig();

  if (level < config.level) {
    return;
  }
  if (!config.componentFilter.empty() &&
      config.componentFilter.find(component) == config.componentFilter.end()) {
    return;
  }

  metrics_.totalMessages++;
  if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
    metrics_.errorCount++;
  } else if (level == LogLevel::WARN) {
    metrics_.warningCount++;
  }

  LogRecord record{level, component, message, context, ""};
  record.formatted = config.format == LogFormat::JSON
                         ? formatJsonMessage(level, component, message, context)
                         : formatTextMessage(level, component, message, context);

  if (config.fileOutput) {
    writeToFile(record.formatted, config);
  }

  std::vector<std::pair<size_t, LogListener>> listeners;
  {
    std::lock_guard<std::mutex> lock(outputMutex_);
    if (config.consoleOutput) {
      std::cout << record.formatted << std::endl;
    }
    listeners = listeners_;
  }

  // Called unlocked so a listener may log or unregister itself
  for (const auto &[handle, listener] : listeners) {
    listener(record);
  }
}

void Logger::debug(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string &component, const std::string &message,
                  const LogContext &context) {
  log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string &component, const std::string &message,
                  const LogContext &context) {
  log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::FATAL, component, message, context);
}

size_t Logger::addListener(LogListener listener) {
  std::lock_guard<std::mutex> lock(outputMutex_);
  size_t handle = nextListenerHandle_++;
  listeners_.emplace_back(handle, std::move(listener));
  return handle;
}

void Logger::removeListener(size_t handle) {
  std::lock_guard<std::mutex> lock(outputMutex_);
  listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                  [handle](const auto &entry) {
                                    return entry.first == handle;
                                  }),
                   listeners_.end());
}

void Logger::clearListeners() {
  std::lock_guard<std::mutex> lock(outputMutex_);
  listeners_.clear();
}

LogMetrics Logger::getMetrics() const { return metrics_; }

void Logger::flush() {
  {
    std::lock_guard<std::mutex> lock(outputMutex_);
    std::cout.flush();
  }
  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.flush();
  }
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.close();
  }
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO ";
  case LogLevel::WARN:
    return "WARN ";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

LogLevel Logger::parseLogLevel(const std::string &levelStr) {
  std::string upper = levelStr;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "DEBUG")
    return LogLevel::DEBUG;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::WARN;
  if (upper == "ERROR")
    return LogLevel::ERROR;
  if (upper == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO;
}

LogFormat Logger::parseLogFormat(const std::string &formatStr) {
  std::string upper = formatStr;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return upper == "JSON" ? LogFormat::JSON : LogFormat::TEXT;
}

std::string Logger::formatTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  oss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::formatTextMessage(LogLevel level,
                                      const std::string &component,
                                      const std::string &message,
                                      const LogContext &context) const {
  std::ostringstream oss;
  oss << "[" << formatTimestamp() << "] "
      << "[" << levelToString(level) << "] "
      << "[" << component << "] " << message;

  if (!context.empty()) {
    oss << " |";
    for (const auto &[key, value] : context) {
      oss << " " << key << "=" << value;
    }
  }

  return oss.str();
}

std::string Logger::formatJsonMessage(LogLevel level,
                                      const std::string &component,
                                      const std::string &message,
                                      const LogContext &context) const {
  std::string levelName = levelToString(level);
  levelName.erase(levelName.find_last_not_of(' ') + 1);

  nlohmann::json json;
  json["timestamp"] = formatTimestamp();
  json["level"] = levelName;
  json["component"] = component;
  json["message"] = message;
  if (!context.empty()) {
    json["context"] = context;
  }
  // Replace invalid UTF-8 instead of throwing from inside the logger
  return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::openLogFile(const std::string &filename) {
  std::filesystem::path logPath(filename);
  std::error_code ec;
  if (logPath.has_parent_path()) {
    std::filesystem::create_directories(logPath.parent_path(), ec);
  }

  fileStream_.open(filename, std::ios::app);
  currentFileSize_ = 0;
  if (fileStream_.is_open() && std::filesystem::exists(filename, ec)) {
    currentFileSize_ = std::filesystem::file_size(filename, ec);
  }
}

void Logger::writeToFile(const std::string &formattedMessage,
                         const LogConfig &config) {
  std::lock_guard<std::mutex> lock(fileMutex_);
  if (!fileStream_.is_open()) {
    return;
  }

  if (config.enableRotation &&
      currentFileSize_ + formattedMessage.length() > config.maxFileSize) {
    rotateLogFile(config);
    if (!fileStream_.is_open()) {
      return;
    }
  }

  fileStream_ << formattedMessage << std::endl;
  currentFileSize_ += formattedMessage.length() + 1;
}

void Logger::rotateLogFile(const LogConfig &config) {
  fileStream_.close();

  std::error_code ec;
  const std::string &base = config.logFile;

  // Shift existing backups, dropping the oldest
  for (int i = config.maxBackupFiles - 1; i > 0; i--) {
    std::string oldFile = base + "." + std::to_string(i);
    std::string newFile = base + "." + std::to_string(i + 1);

    if (std::filesystem::exists(oldFile, ec)) {
      if (i == config.maxBackupFiles - 1) {
        std::filesystem::remove(newFile, ec);
      }
      std::filesystem::rename(oldFile, newFile, ec);
    }
  }

  if (std::filesystem::exists(base, ec)) {
    std::filesystem::rename(base, base + ".1", ec);
  }

  fileStream_.open(base, std::ios::out);
  currentFileSize_ = 0;

  if (!fileStream_.is_open()) {
    std::cerr << "Failed to create new log file after rotation: " << base
              << std::endl;
  }
}

} // namespace fieldguard
