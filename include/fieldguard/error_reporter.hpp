#pragma once

#include "fieldguard/pattern_registry.hpp"
#include "fieldguard/validation_outcome.hpp"
#include <optional>
#include <string>
#include <vector>

namespace fieldguard {

// Facts gathered by the validator that shape a rejection message
struct RejectionDetail {
  std::optional<StructuralRule> structuralRule;
  std::optional<char> offendingCharacter;
  std::vector<SanitizationFinding> findings;
};

/**
 * @brief Single place that renders rejection text
 *
 * Character lists in messages come only from the rule's
 * allowedCharsDescription, so changing a rule's classes changes every message
 * that cites it.
 */
class ErrorReporter {
public:
  static Rejected reject(const std::string &fieldLabel, RejectionSignal signal,
                         const ValidationRule &rule,
                         const RejectionDetail &detail = {});

  // "a", "a and b", "a, b, and c"
  static std::string joinNaturalList(const std::vector<std::string> &items,
                                     const std::string &conjunction = "and");

  static std::string allowedCharactersSentence(const std::string &fieldLabel,
                                               const ValidationRule &rule);

private:
  static std::string structuralReason(const std::string &fieldLabel,
                                      const ValidationRule &rule,
                                      std::optional<StructuralRule> structural);
  static std::string offendingCharacterSentence(char c);
  static std::string findingKindsList(
      const std::vector<SanitizationFinding> &findings);
};

} // namespace fieldguard
