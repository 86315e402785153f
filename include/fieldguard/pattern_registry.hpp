#pragma once

#include "fieldguard/char_class.hpp"
#include "fieldguard/field_kind.hpp"
#include "fieldguard/registry_config.hpp"
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace fieldguard {

/**
 * @brief Compiled, immutable rule for one field kind
 *
 * The anchored pattern, the member set and the description are all derived
 * from the same ordered class list at construction.
 */
class ValidationRule {
public:
  ValidationRule(FieldKind kind, const RuleSpec &spec);

  FieldKind kind() const { return kind_; }
  const std::regex &pattern() const { return pattern_; }
  const std::string &patternSource() const { return patternSource_; }
  const std::vector<std::string> &allowedCharsDescription() const {
    return description_;
  }
  const std::vector<CharClassEntry> &classes() const { return classes_; }
  const CharSet &allowedCharacters() const { return allowed_; }
  size_t minLength() const { return minLength_; }
  size_t maxLength() const { return maxLength_; }
  bool mustStartWithLetter() const { return mustStartWithLetter_; }
  bool pathLike() const { return pathLike_; }
  const std::vector<std::string> &allowedSchemes() const {
    return allowedSchemes_;
  }

  // Whole-value match against the compiled pattern
  bool matches(const std::string &value) const;
  bool allows(char c) const { return allowed_.test(charIndex(c)); }
  std::optional<char> firstDisallowedCharacter(const std::string &value) const;
  bool isSchemeAllowed(const std::string &scheme) const;

private:
  FieldKind kind_;
  std::vector<CharClassEntry> classes_;
  std::vector<std::string> description_;
  CharSet allowed_;
  std::string patternSource_;
  std::regex pattern_;
  size_t minLength_;
  size_t maxLength_;
  bool mustStartWithLetter_;
  bool pathLike_;
  std::vector<std::string> allowedSchemes_;
};

/**
 * @brief Process-wide, read-only table of validation rules
 *
 * Every rule passes selfTest() during construction, so a registry that exists
 * has no pattern/description drift. Safe to share across threads without
 * locking.
 */
class PatternRegistry {
public:
  explicit PatternRegistry(const RegistryConfig &config = RegistryConfig::defaults());

  /**
   * @brief Rule for a field kind
   * @throws SystemException (UNKNOWN_FIELD_KIND) if no rule is registered
   */
  const ValidationRule &describe(FieldKind kind) const;

  bool hasRule(FieldKind kind) const { return rules_.count(kind) > 0; }
  std::vector<FieldKind> kinds() const;

  /**
   * @brief Verify a compiled rule against its own description
   *
   * Checks every class example is accepted, every disjoint catalog class is
   * rejected, and that the pattern accepts exactly the declared byte set.
   * @throws ConfigException on any mismatch
   */
  static void selfTest(const ValidationRule &rule);

private:
  std::map<FieldKind, ValidationRule> rules_;
};

} // namespace fieldguard
