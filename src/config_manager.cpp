#include "fieldguard/config_manager.hpp"
#include "fieldguard/exceptions.hpp"
#include "fieldguard/pattern_registry.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace fieldguard {

namespace {

constexpr const char *kRulesSection = "validation.rules";

std::string toUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return value;
}

ConfigException ruleError(FieldKind kind, const std::string &message) {
  return ConfigException(ErrorCode::CONFIG_PARSE_ERROR,
                         std::string(kRulesSection) + "." +
                             fieldKindToString(kind) + ": " + message,
                         kRulesSection, {{"kind", fieldKindToString(kind)}});
}

size_t readLength(FieldKind kind, const nlohmann::json &json,
                  const std::string &key) {
  const auto &value = json.at(key);
  if (!value.is_number_unsigned()) {
    throw ruleError(kind, key + " must be a non-negative integer");
  }
  return value.get<size_t>();
}

bool readFlag(FieldKind kind, const nlohmann::json &json,
              const std::string &key) {
  const auto &value = json.at(key);
  if (!value.is_boolean()) {
    throw ruleError(kind, key + " must be a boolean");
  }
  return value.get<bool>();
}

} // namespace

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  CONFIG_LOG_INFO("Loading configuration from: {}", configPath);

  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_ERROR("Cannot open config file: {}", configPath);
    return false;
  }

  nlohmann::json json = nlohmann::json::parse(file, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file: {}", configPath);
    return false;
  }

  {
    std::scoped_lock lock(configMutex_);
    configFilePath_ = configPath;
  }
  return applyJson(json);
}

bool ConfigManager::loadConfigFromString(const std::string &jsonText) {
  nlohmann::json json = nlohmann::json::parse(jsonText, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration string");
    return false;
  }
  return applyJson(json);
}

void ConfigManager::clear() {
  std::scoped_lock lock(configMutex_);
  configData_.clear();
  rawConfig_ = nlohmann::json::object();
  configFilePath_.clear();
}

bool ConfigManager::applyJson(const nlohmann::json &json) {
  size_t parameterCount = 0;
  {
    std::scoped_lock lock(configMutex_);
    configData_.clear();
    rawConfig_ = json;
    flattenJson(rawConfig_, "", 0, 32);
    parameterCount = configData_.size();
  }
  CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                  parameterCount);
  return true;
}

void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int currentDepth,
                                int maxDepth) {
  if (currentDepth >= maxDepth) {
    configData_[prefix] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth);
    } else if (it->is_string()) {
      configData_[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      configData_[key] = std::to_string(it->get<long long>());
    } else if (it->is_boolean()) {
      configData_[key] = it->get<bool>() ? "true" : "false";
    } else {
      // Arrays and floats keep their JSON text
      configData_[key] = it->dump();
    }
  }
}

std::string ConfigManager::lookup(const std::string &key) const {
  std::scoped_lock lock(configMutex_);
  auto it = configData_.find(key);
  return it == configData_.end() ? std::string() : it->second;
}

bool ConfigManager::contains(const std::string &key) const {
  std::scoped_lock lock(configMutex_);
  return configData_.count(key) > 0;
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  return contains(key) ? lookup(key) : defaultValue;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  if (!contains(key)) {
    return defaultValue;
  }
  try {
    return std::stoi(lookup(key));
  } catch (const std::invalid_argument &) {
    return defaultValue;
  } catch (const std::out_of_range &) {
    return defaultValue;
  }
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  if (!contains(key)) {
    return defaultValue;
  }
  std::string value = lookup(key);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value == "true" || value == "1" || value == "yes" || value == "on";
}

std::unordered_set<std::string>
ConfigManager::getStringSet(const std::string &key) const {
  std::unordered_set<std::string> result;
  if (!contains(key)) {
    return result;
  }

  nlohmann::json array = nlohmann::json::parse(lookup(key), nullptr, false);
  if (array.is_discarded() || !array.is_array()) {
    return result;
  }
  for (const auto &item : array) {
    if (item.is_string()) {
      result.insert(item.get<std::string>());
    }
  }
  return result;
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = Logger::parseLogLevel(getString("logging.level", "INFO"));
  config.format = Logger::parseLogFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.logFile = getString("logging.log_file", "logs/fieldguard.log");
  config.maxFileSize =
      static_cast<size_t>(getInt("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  config.componentFilter = getStringSet("logging.component_filter");

  return config;
}

RegistryConfig ConfigManager::getRegistryConfig() const {
  std::scoped_lock lock(configMutex_);
  return buildRegistryConfig();
}

RegistryConfig ConfigManager::buildRegistryConfig() const {
  RegistryConfig config = RegistryConfig::defaults();

  if (!rawConfig_.is_object() || !rawConfig_.contains("validation")) {
    return config;
  }
  const auto &validation = rawConfig_.at("validation");
  if (!validation.is_object() || !validation.contains("rules")) {
    return config;
  }
  const auto &rules = validation.at("rules");
  if (!rules.is_object()) {
    throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                          "validation.rules must be an object", kRulesSection);
  }

  for (auto it = rules.begin(); it != rules.end(); ++it) {
    auto kind = fieldKindFromString(it.key());
    if (!kind) {
      throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                            "Unknown field kind in validation.rules: " +
                                it.key(),
                            kRulesSection, {{"kind", it.key()}});
    }
    if (!it->is_object()) {
      throw ruleError(*kind, "rule must be an object");
    }
    config.setRule(*kind, parseRuleSpec(*kind, *it));
    CONFIG_LOG_DEBUG("Rule override applied for {}", it.key());
  }

  return config;
}

RuleSpec ConfigManager::parseRuleSpec(FieldKind kind,
                                      const nlohmann::json &json) {
  RuleSpec rule = RegistryConfig::defaultRule(kind);

  if (json.contains("classes")) {
    const auto &classes = json.at("classes");
    if (!classes.is_array()) {
      throw ruleError(kind, "classes must be an array");
    }
    rule.classes.clear();
    for (const auto &entry : classes) {
      if (!entry.is_object() || !entry.contains("class") ||
          !entry.at("class").is_string()) {
        throw ruleError(kind, "each class entry needs a \"class\" name");
      }
      std::string className = entry.at("class").get<std::string>();
      if (!entry.contains("example") || !entry.at("example").is_string() ||
          entry.at("example").get<std::string>().size() != 1) {
        throw ruleError(kind, "class '" + className +
                                  "' needs a single-character \"example\"");
      }
      rule.classes.push_back(
          catalogEntry(className, entry.at("example").get<std::string>()[0]));
    }
  }

  if (json.contains("min_length")) {
    rule.minLength = readLength(kind, json, "min_length");
  }
  if (json.contains("max_length")) {
    rule.maxLength = readLength(kind, json, "max_length");
  }
  if (json.contains("must_start_with_letter")) {
    rule.mustStartWithLetter = readFlag(kind, json, "must_start_with_letter");
  }
  if (json.contains("path_like")) {
    rule.pathLike = readFlag(kind, json, "path_like");
  }
  if (json.contains("allowed_schemes")) {
    const auto &schemes = json.at("allowed_schemes");
    if (!schemes.is_array()) {
      throw ruleError(kind, "allowed_schemes must be an array");
    }
    rule.allowedSchemes.clear();
    for (const auto &scheme : schemes) {
      if (!scheme.is_string() || scheme.get<std::string>().empty()) {
        throw ruleError(kind, "allowed_schemes entries must be non-empty "
                              "strings");
      }
      rule.allowedSchemes.push_back(scheme.get<std::string>());
    }
  }

  return rule;
}

ConfigValidationResult ConfigManager::validateConfiguration() const {
  ConfigValidationResult result;

  static const std::unordered_set<std::string> levels = {
      "DEBUG", "INFO", "WARN", "WARNING", "ERROR", "FATAL"};
  if (contains("logging.level") &&
      levels.count(toUpper(getString("logging.level"))) == 0) {
    result.addWarning("Unknown logging.level '" + getString("logging.level") +
                      "', falling back to INFO");
  }

  if (contains("logging.format")) {
    std::string format = toUpper(getString("logging.format"));
    if (format != "TEXT" && format != "JSON") {
      result.addWarning("Unknown logging.format '" +
                        getString("logging.format") +
                        "', falling back to TEXT");
    }
  }

  if (getInt("logging.max_file_size", 10485760) <= 0) {
    result.addError("logging.max_file_size must be positive");
  }
  if (getInt("logging.max_backup_files", 5) < 0) {
    result.addError("logging.max_backup_files must not be negative");
  }

  try {
    PatternRegistry registry(getRegistryConfig());
  } catch (const ConfigException &e) {
    result.addError(e.getMessage());
  }

  return result;
}

nlohmann::json ConfigManager::getJsonConfig() const {
  std::scoped_lock lock(configMutex_);
  return rawConfig_;
}

} // namespace fieldguard
