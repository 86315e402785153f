#pragma once

#include "fieldguard/char_class.hpp"
#include "fieldguard/field_kind.hpp"
#include <map>
#include <string>
#include <vector>

namespace fieldguard {

// One accepted character class plus a literal the startup self-test feeds
// through the compiled pattern
struct CharClassEntry {
  CharClass charClass;
  char literalExample;
};

// Looks up a catalog class by name; throws ConfigException when the name is
// unknown or the example is not a member
CharClassEntry catalogEntry(const std::string &className, char literalExample);

// Configuration of a single field kind. The ordered class list is the single
// source for both the generated pattern and the rejection message.
struct RuleSpec {
  std::vector<CharClassEntry> classes;
  size_t minLength = 1;
  size_t maxLength = 255;
  bool mustStartWithLetter = false;
  bool pathLike = false;                   // enables traversal detection
  std::vector<std::string> allowedSchemes; // lowercase; empty = no scheme rule
};

/**
 * @brief Explicitly constructed rule table handed to PatternRegistry
 *
 * Built once at startup (in code or by ConfigManager from JSON) and copied
 * into the registry; nothing reads it through global state.
 */
struct RegistryConfig {
  std::map<FieldKind, RuleSpec> rules;

  static RegistryConfig defaults();
  static RuleSpec defaultRule(FieldKind kind);

  void setRule(FieldKind kind, RuleSpec rule) { rules[kind] = std::move(rule); }
  bool hasRule(FieldKind kind) const { return rules.count(kind) > 0; }
};

} // namespace fieldguard
