#include "fieldguard/pattern_registry.hpp"
#include "fieldguard/exceptions.hpp"
#include "fieldguard/logger.hpp"
#include <algorithm>
#include <cctype>

namespace fieldguard {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

ConfigException driftError(const ValidationRule &rule,
                           const std::string &message, char c) {
  return ConfigException(ErrorCode::PATTERN_DRIFT,
                         fieldKindToString(rule.kind()) + ": " + message,
                         fieldKindToString(rule.kind()),
                         {{"character", describeCharacter(c)},
                          {"pattern", rule.patternSource()}});
}

} // namespace

ValidationRule::ValidationRule(FieldKind kind, const RuleSpec &spec)
    : kind_(kind), classes_(spec.classes), minLength_(spec.minLength),
      maxLength_(spec.maxLength), mustStartWithLetter_(spec.mustStartWithLetter),
      pathLike_(spec.pathLike) {
  if (classes_.empty()) {
    throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                          "Rule declares no character classes",
                          fieldKindToString(kind));
  }

  for (const auto &entry : classes_) {
    description_.push_back(entry.charClass.name());
    allowed_ |= entry.charClass.members();
  }

  for (const auto &scheme : spec.allowedSchemes) {
    allowedSchemes_.push_back(toLower(scheme));
  }

  patternSource_ = "^[" + regexFragmentFor(allowed_) + "]+$";
  try {
    pattern_ = std::regex(patternSource_, std::regex::ECMAScript);
  } catch (const std::regex_error &e) {
    throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                          "Generated pattern failed to compile: " +
                              std::string(e.what()),
                          fieldKindToString(kind),
                          {{"pattern", patternSource_}});
  }
}

bool ValidationRule::matches(const std::string &value) const {
  return std::regex_match(value, pattern_);
}

std::optional<char>
ValidationRule::firstDisallowedCharacter(const std::string &value) const {
  for (char c : value) {
    if (!allows(c)) {
      return c;
    }
  }
  return std::nullopt;
}

bool ValidationRule::isSchemeAllowed(const std::string &scheme) const {
  std::string lowered = toLower(scheme);
  return std::find(allowedSchemes_.begin(), allowedSchemes_.end(), lowered) !=
         allowedSchemes_.end();
}

PatternRegistry::PatternRegistry(const RegistryConfig &config) {
  for (const auto &[kind, spec] : config.rules) {
    try {
      ValidationRule rule(kind, spec);
      selfTest(rule);
      REGISTRY_LOG_DEBUG("Registered {} rule: {}", fieldKindToString(kind),
                         rule.patternSource());
      rules_.emplace(kind, std::move(rule));
    } catch (const ConfigException &e) {
      REGISTRY_LOG_ERROR("Rejected rule for {}: {}", fieldKindToString(kind),
                         e.toLogString());
      throw;
    }
  }

  REGISTRY_LOG_INFO("Pattern registry initialized with {} rules",
                    rules_.size());
}

const ValidationRule &PatternRegistry::describe(FieldKind kind) const {
  auto it = rules_.find(kind);
  if (it == rules_.end()) {
    throw SystemException(ErrorCode::UNKNOWN_FIELD_KIND,
                          "No validation rule registered for field kind " +
                              fieldKindToString(kind),
                          "PatternRegistry",
                          {{"kind", std::to_string(static_cast<int>(kind))}});
  }
  return it->second;
}

std::vector<FieldKind> PatternRegistry::kinds() const {
  std::vector<FieldKind> result;
  result.reserve(rules_.size());
  for (const auto &[kind, rule] : rules_) {
    result.push_back(kind);
  }
  return result;
}

void PatternRegistry::selfTest(const ValidationRule &rule) {
  const std::string kindName = fieldKindToString(rule.kind());

  if (rule.minLength() < 1 || rule.minLength() > rule.maxLength()) {
    throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                          kindName + ": length bounds must satisfy 1 <= min "
                                     "<= max (got " +
                              std::to_string(rule.minLength()) + ".." +
                              std::to_string(rule.maxLength()) + ")",
                          kindName);
  }

  if (rule.mustStartWithLetter()) {
    auto letters = CharClassCatalog::find("letters");
    if (letters && (letters->members() & rule.allowedCharacters()).none()) {
      throw ConfigException(ErrorCode::CONFIGURATION_ERROR,
                            kindName + ": must start with a letter but no "
                                       "letters are allowed",
                            kindName);
    }
  }

  // Each declared class: its example is a member and the pattern accepts it
  for (const auto &entry : rule.classes()) {
    if (!entry.charClass.contains(entry.literalExample)) {
      throw driftError(rule,
                       "example is not a member of class '" +
                           entry.charClass.name() + "'",
                       entry.literalExample);
    }
    if (!rule.matches(std::string(1, entry.literalExample))) {
      throw driftError(rule,
                       "pattern rejects example of declared class '" +
                           entry.charClass.name() + "'",
                       entry.literalExample);
    }
  }

  // Each excluded catalog class: a representative is rejected
  for (const auto &cls : CharClassCatalog::all()) {
    if ((cls.members() & rule.allowedCharacters()).any()) {
      continue;
    }
    char probe = cls.firstMember();
    if (rule.matches(std::string(1, probe))) {
      throw driftError(rule,
                       "pattern accepts excluded class '" + cls.name() + "'",
                       probe);
    }
  }

  // Exhaustive sweep: accepted bytes are exactly the declared set
  for (size_t i = 0; i < 256; ++i) {
    char c = static_cast<char>(i);
    bool declared = rule.allowedCharacters().test(i);
    if (rule.matches(std::string(1, c)) != declared) {
      throw driftError(rule,
                       declared ? "pattern rejects a declared character"
                                : "pattern accepts an undeclared character",
                       c);
    }
  }
}

} // namespace fieldguard
