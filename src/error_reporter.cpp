#include "fieldguard/error_reporter.hpp"
#include "fieldguard/char_class.hpp"
#include <algorithm>

namespace fieldguard {

std::string ErrorReporter::joinNaturalList(const std::vector<std::string> &items,
                                           const std::string &conjunction) {
  if (items.empty()) {
    return "";
  }
  if (items.size() == 1) {
    return items.front();
  }
  if (items.size() == 2) {
    return items[0] + " " + conjunction + " " + items[1];
  }

  std::string result;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      result += ", ";
    }
    if (i == items.size() - 1) {
      result += conjunction + " ";
    }
    result += items[i];
  }
  return result;
}

std::string
ErrorReporter::allowedCharactersSentence(const std::string &fieldLabel,
                                         const ValidationRule &rule) {
  return fieldLabel + " can only contain " +
         joinNaturalList(rule.allowedCharsDescription()) + ".";
}

std::string ErrorReporter::offendingCharacterSentence(char c) {
  auto className = CharClassCatalog::classify(c);
  if (className) {
    return "Character " + describeCharacter(c) + " (" + *className +
           ") is not allowed.";
  }
  return "Character " + describeCharacter(c) + " is not allowed.";
}

std::string ErrorReporter::findingKindsList(
    const std::vector<SanitizationFinding> &findings) {
  std::vector<std::string> kinds;
  for (const auto &finding : findings) {
    std::string name = findingKindToString(finding.kind);
    if (std::find(kinds.begin(), kinds.end(), name) == kinds.end()) {
      kinds.push_back(name);
    }
  }
  return joinNaturalList(kinds);
}

std::string
ErrorReporter::structuralReason(const std::string &fieldLabel,
                                const ValidationRule &rule,
                                std::optional<StructuralRule> structural) {
  if (!structural) {
    return fieldLabel + " is not well-formed.";
  }

  switch (*structural) {
  case StructuralRule::StartsWithLetter:
    return fieldLabel + " must start with a letter. " +
           allowedCharactersSentence(fieldLabel, rule);
  case StructuralRule::SchemeMissing:
    return fieldLabel + " must start with a scheme (" +
           joinNaturalList(rule.allowedSchemes(), "or") + ").";
  case StructuralRule::SchemeNotAllowed:
    return fieldLabel + " must use one of the allowed schemes: " +
           joinNaturalList(rule.allowedSchemes(), "or") + ".";
  case StructuralRule::HostMissing:
    return fieldLabel + " must include a host after '//'.";
  case StructuralRule::CredentialsPresent:
    return fieldLabel + " must not contain embedded credentials.";
  case StructuralRule::InvalidPercentEncoding:
    return fieldLabel + " contains an invalid percent-encoding; '%' must be "
                        "followed by two hexadecimal digits.";
  case StructuralRule::UuidFormat:
    return fieldLabel + " must be a UUID (32 hexadecimal digits, optionally "
                        "grouped 8-4-4-4-12).";
  case StructuralRule::MimeTypeFormat:
    return fieldLabel + " must be a MIME type of the form type/subtype.";
  default:
    return fieldLabel + " is not well-formed.";
  }
}

Rejected ErrorReporter::reject(const std::string &fieldLabel,
                               RejectionSignal signal,
                               const ValidationRule &rule,
                               const RejectionDetail &detail) {
  Rejected rejected;
  rejected.fieldName = fieldLabel;
  rejected.signal = signal;
  rejected.allowedCharsDescription = rule.allowedCharsDescription();
  rejected.structuralRule = detail.structuralRule;
  rejected.offendingCharacter = detail.offendingCharacter;
  rejected.findings = detail.findings;

  switch (signal) {
  case RejectionSignal::MissingValue:
    rejected.reason = fieldLabel + " cannot be empty.";
    break;
  case RejectionSignal::LengthViolation:
    rejected.reason = fieldLabel + " must be between " +
                      std::to_string(rule.minLength()) + " and " +
                      std::to_string(rule.maxLength()) + " characters long.";
    break;
  case RejectionSignal::StructuralViolation:
    rejected.reason =
        structuralReason(fieldLabel, rule, detail.structuralRule);
    break;
  case RejectionSignal::PatternViolation:
    rejected.reason = allowedCharactersSentence(fieldLabel, rule);
    if (detail.offendingCharacter) {
      rejected.reason +=
          " " + offendingCharacterSentence(*detail.offendingCharacter);
    }
    break;
  case RejectionSignal::UnsafeContent:
    rejected.reason = fieldLabel + " contains potentially unsafe content";
    if (!detail.findings.empty()) {
      rejected.reason += " (" + findingKindsList(detail.findings) + ")";
    }
    rejected.reason += ".";
    break;
  default:
    rejected.reason = fieldLabel + " is invalid.";
    break;
  }

  return rejected;
}

} // namespace fieldguard
