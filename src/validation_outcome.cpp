#include "fieldguard/validation_outcome.hpp"
#include "fieldguard/char_class.hpp"
#include "fieldguard/exceptions.hpp"

namespace fieldguard {

std::string rejectionSignalToString(RejectionSignal signal) {
  switch (signal) {
  case RejectionSignal::MissingValue:
    return "MissingValue";
  case RejectionSignal::LengthViolation:
    return "LengthViolation";
  case RejectionSignal::StructuralViolation:
    return "StructuralViolation";
  case RejectionSignal::PatternViolation:
    return "PatternViolation";
  case RejectionSignal::UnsafeContent:
    return "UnsafeContent";
  default:
    return "Unknown";
  }
}

ErrorCode rejectionSignalToErrorCode(RejectionSignal signal) {
  switch (signal) {
  case RejectionSignal::MissingValue:
    return ErrorCode::MISSING_VALUE;
  case RejectionSignal::LengthViolation:
    return ErrorCode::LENGTH_VIOLATION;
  case RejectionSignal::StructuralViolation:
    return ErrorCode::STRUCTURAL_VIOLATION;
  case RejectionSignal::PatternViolation:
    return ErrorCode::PATTERN_VIOLATION;
  case RejectionSignal::UnsafeContent:
    return ErrorCode::UNSAFE_CONTENT;
  default:
    return ErrorCode::INTERNAL_ERROR;
  }
}

std::string structuralRuleToString(StructuralRule rule) {
  switch (rule) {
  case StructuralRule::StartsWithLetter:
    return "StartsWithLetter";
  case StructuralRule::SchemeMissing:
    return "SchemeMissing";
  case StructuralRule::SchemeNotAllowed:
    return "SchemeNotAllowed";
  case StructuralRule::HostMissing:
    return "HostMissing";
  case StructuralRule::CredentialsPresent:
    return "CredentialsPresent";
  case StructuralRule::InvalidPercentEncoding:
    return "InvalidPercentEncoding";
  case StructuralRule::UuidFormat:
    return "UuidFormat";
  case StructuralRule::MimeTypeFormat:
    return "MimeTypeFormat";
  default:
    return "Unknown";
  }
}

nlohmann::json Rejected::toJson() const {
  nlohmann::json json;
  json["field"] = fieldName;
  json["signal"] = rejectionSignalToString(signal);
  json["code"] = errorCodeToString(errorCode());
  json["message"] = reason;

  if (!allowedCharsDescription.empty()) {
    json["allowed"] = allowedCharsDescription;
  }
  if (structuralRule) {
    json["rule"] = structuralRuleToString(*structuralRule);
  }
  if (offendingCharacter) {
    json["offending_character"] = describeCharacter(*offendingCharacter);
  }
  if (!findings.empty()) {
    json["findings"] = nlohmann::json::array();
    for (const auto &finding : findings) {
      json["findings"].push_back({{"kind", findingKindToString(finding.kind)},
                                  {"offset", finding.offset},
                                  {"length", finding.length}});
    }
  }
  return json;
}

bool Rejected::operator==(const Rejected &other) const {
  return fieldName == other.fieldName && signal == other.signal &&
         reason == other.reason &&
         allowedCharsDescription == other.allowedCharsDescription &&
         structuralRule == other.structuralRule &&
         offendingCharacter == other.offendingCharacter &&
         findings == other.findings;
}

const Accepted &ValidationOutcome::accepted() const {
  if (const auto *value = std::get_if<Accepted>(&result_)) {
    return *value;
  }
  throw SystemException(ErrorCode::INTERNAL_ERROR,
                        "Outcome is a rejection, not an accepted value",
                        "ValidationOutcome");
}

const Rejected &ValidationOutcome::rejected() const {
  if (const auto *value = std::get_if<Rejected>(&result_)) {
    return *value;
  }
  throw SystemException(ErrorCode::INTERNAL_ERROR,
                        "Outcome is an accepted value, not a rejection",
                        "ValidationOutcome");
}

nlohmann::json ValidationOutcome::toJson() const {
  if (isAccepted()) {
    return {{"accepted", true}, {"value", accepted().normalizedValue}};
  }
  nlohmann::json json = rejected().toJson();
  json["accepted"] = false;
  return json;
}

void ValidationReport::add(const std::string &label,
                           const ValidationOutcome &outcome) {
  if (outcome.isAccepted()) {
    acceptedValues.emplace_back(label, outcome.accepted().normalizedValue);
  } else {
    errors.push_back(outcome.rejected());
  }
}

nlohmann::json ValidationReport::toJson() const {
  nlohmann::json json;
  json["valid"] = isValid();
  if (!errors.empty()) {
    json["errors"] = nlohmann::json::array();
    for (const auto &error : errors) {
      json["errors"].push_back(error.toJson());
    }
  }
  return json;
}

std::string ValidationReport::toJsonString() const {
  return toJson().dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace);
}

} // namespace fieldguard
