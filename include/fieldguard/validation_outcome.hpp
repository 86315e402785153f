#pragma once

#include "fieldguard/error_codes.hpp"
#include "fieldguard/field_kind.hpp"
#include "fieldguard/secondary_sanitizer.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fieldguard {

enum class RejectionSignal {
  MissingValue,
  LengthViolation,
  StructuralViolation,
  PatternViolation,
  UnsafeContent
};

std::string rejectionSignalToString(RejectionSignal signal);
ErrorCode rejectionSignalToErrorCode(RejectionSignal signal);

enum class StructuralRule {
  StartsWithLetter,
  SchemeMissing,
  SchemeNotAllowed,
  HostMissing,
  CredentialsPresent,
  InvalidPercentEncoding,
  UuidFormat,
  MimeTypeFormat
};

std::string structuralRuleToString(StructuralRule rule);

struct Accepted {
  std::string normalizedValue;

  bool operator==(const Accepted &other) const {
    return normalizedValue == other.normalizedValue;
  }
};

struct Rejected {
  std::string fieldName;
  RejectionSignal signal;
  std::string reason;
  std::vector<std::string> allowedCharsDescription;
  std::optional<StructuralRule> structuralRule;
  std::optional<char> offendingCharacter;
  std::vector<SanitizationFinding> findings;

  ErrorCode errorCode() const { return rejectionSignalToErrorCode(signal); }

  // Never includes the raw value or matched spans
  nlohmann::json toJson() const;

  bool operator==(const Rejected &other) const;
};

/**
 * @brief Result of a single validation call
 *
 * Owned by the caller. Accessing the wrong alternative throws
 * SystemException(INTERNAL_ERROR).
 */
class ValidationOutcome {
public:
  ValidationOutcome(Accepted accepted) : result_(std::move(accepted)) {}
  ValidationOutcome(Rejected rejected) : result_(std::move(rejected)) {}

  bool isAccepted() const { return std::holds_alternative<Accepted>(result_); }
  bool isRejected() const { return std::holds_alternative<Rejected>(result_); }

  const Accepted &accepted() const;
  const Rejected &rejected() const;

  nlohmann::json toJson() const;

  bool operator==(const ValidationOutcome &other) const {
    return result_ == other.result_;
  }
  bool operator!=(const ValidationOutcome &other) const {
    return !(*this == other);
  }

private:
  std::variant<Accepted, Rejected> result_;
};

// One field of a multi-field request
struct FieldInput {
  FieldKind kind;
  std::string value;
  std::string label;
};

// Aggregated outcome of validating every field of a request
struct ValidationReport {
  std::vector<std::pair<std::string, std::string>> acceptedValues;
  std::vector<Rejected> errors;

  bool isValid() const { return errors.empty(); }
  void add(const std::string &label, const ValidationOutcome &outcome);

  nlohmann::json toJson() const;
  std::string toJsonString() const;
};

} // namespace fieldguard
