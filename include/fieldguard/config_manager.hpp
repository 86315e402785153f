#pragma once

#include "fieldguard/logger.hpp"
#include "fieldguard/registry_config.hpp"
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fieldguard {

// Configuration validation result
struct ConfigValidationResult {
  bool isValid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void addError(const std::string &error) {
    isValid = false;
    errors.push_back(error);
  }

  void addWarning(const std::string &warning) { warnings.push_back(warning); }
};

/**
 * @brief JSON-backed startup configuration
 *
 * Scalar values are flattened to dotted keys ("logging.level") for the typed
 * getters; the raw document is kept for structured sections such as
 * validation.rules. Loaded once at startup; there is no hot reload.
 */
class ConfigManager {
public:
  static ConfigManager &getInstance();

  bool loadConfig(const std::string &configPath);
  bool loadConfigFromString(const std::string &jsonText);
  void clear();

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  std::unordered_set<std::string> getStringSet(const std::string &key) const;

  // Logging configuration helpers
  LogConfig getLoggingConfig() const;

  /**
   * @brief Rule table for PatternRegistry
   *
   * Starts from RegistryConfig::defaults() and replaces, per kind, any field
   * given under validation.rules.<kind>.
   * @throws ConfigException for unknown kinds, unknown class names, malformed
   * examples or mistyped values
   */
  RegistryConfig getRegistryConfig() const;

  // Reports problems without throwing
  ConfigValidationResult validateConfiguration() const;

  // Get raw JSON configuration
  nlohmann::json getJsonConfig() const;

private:
  ConfigManager() = default;

  mutable std::mutex configMutex_;
  std::unordered_map<std::string, std::string> configData_;
  std::string configFilePath_;
  nlohmann::json rawConfig_;

  bool applyJson(const nlohmann::json &json);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth);
  std::string lookup(const std::string &key) const;
  bool contains(const std::string &key) const;
  RegistryConfig buildRegistryConfig() const;
  static RuleSpec parseRuleSpec(FieldKind kind, const nlohmann::json &json);
};

} // namespace fieldguard
