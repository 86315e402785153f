#pragma once

#include "fieldguard/logger.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace fieldguard {

template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class PatternRegistry> {
  static constexpr const char *name = "PatternRegistry";
};

template <> struct ComponentTrait<class FieldValidator> {
  static constexpr const char *name = "FieldValidator";
};

/**
 * ComponentLogger - compile-time component names for Logger calls.
 *
 * Messages may contain "{}" placeholders, filled in order by the trailing
 * arguments.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    getLogger().debug(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    getLogger().info(component_name,
                     format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    getLogger().warn(component_name,
                     format_message(message, std::forward<Args>(args)...));
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    getLogger().error(component_name,
                      format_message(message, std::forward<Args>(args)...));
  }

  // Context-aware logging with metadata

  static void debugWithContext(const std::string &message,
                               const LogContext &context = {}) {
    getLogger().debug(component_name, message, context);
  }

  static void warnWithContext(const std::string &message,
                              const LogContext &context = {}) {
    getLogger().warn(component_name, message, context);
  }

  static constexpr const char *getComponentName() { return component_name; }

private:
  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    if constexpr (std::is_arithmetic_v<std::decay_t<T>> ||
                  std::is_convertible_v<T, std::string>) {
      ss << std::forward<T>(value);
    } else {
      ss << "[object]";
    }
  }

  template <typename... Args>
  static std::string format_message(const std::string &format,
                                    Args &&...args) {
    if constexpr (sizeof...(args) == 0) {
      return format;
    } else {
      std::stringstream ss;
      format_impl(ss, format, std::forward<Args>(args)...);
      return ss.str();
    }
  }

  template <typename T, typename... Args>
  static void format_impl(std::stringstream &ss, const std::string &format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos != std::string::npos) {
      ss << format.substr(0, pos);
      stream_value(ss, std::forward<T>(arg));
      if constexpr (sizeof...(args) > 0) {
        format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
      } else {
        ss << format.substr(pos + 2);
      }
    } else {
      ss << format;
    }
  }
};

using ConfigLogger = ComponentLogger<class ConfigManager>;
using RegistryLogger = ComponentLogger<class PatternRegistry>;
using ValidatorLogger = ComponentLogger<class FieldValidator>;

} // namespace fieldguard

#define CONFIG_LOG_DEBUG(message, ...)                                         \
  fieldguard::ConfigLogger::debug(message, ##__VA_ARGS__)
#define CONFIG_LOG_INFO(message, ...)                                          \
  fieldguard::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  fieldguard::ConfigLogger::error(message, ##__VA_ARGS__)

#define REGISTRY_LOG_DEBUG(message, ...)                                       \
  fieldguard::RegistryLogger::debug(message, ##__VA_ARGS__)
#define REGISTRY_LOG_INFO(message, ...)                                        \
  fieldguard::RegistryLogger::info(message, ##__VA_ARGS__)
#define REGISTRY_LOG_ERROR(message, ...)                                       \
  fieldguard::RegistryLogger::error(message, ##__VA_ARGS__)
