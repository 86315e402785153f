#include "fieldguard/field_validator.hpp"
#include "fieldguard/exceptions.hpp"
#include "fieldguard/logger.hpp"
#include "fieldguard/secondary_sanitizer.hpp"
#include <cctype>

namespace fieldguard {

namespace {

bool isAsciiLetter(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isHexDigit(char c) {
  return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

FieldValidator::FieldValidator()
    : FieldValidator(std::make_shared<const PatternRegistry>()) {}

FieldValidator::FieldValidator(std::shared_ptr<const PatternRegistry> registry)
    : registry_(std::move(registry)) {
  if (!registry_) {
    throw SystemException(ErrorCode::INTERNAL_ERROR,
                          "FieldValidator requires a pattern registry",
                          "FieldValidator");
  }
}

ValidationOutcome FieldValidator::validate(FieldKind kind,
                                           const std::string &raw,
                                           const std::string &label) const {
  const ValidationRule &rule = registry_->describe(kind);

  auto rejectWith = [&](RejectionSignal signal,
                        const RejectionDetail &detail = {}) {
    Rejected rejected = ErrorReporter::reject(label, signal, rule, detail);
    logRejection(kind, rejected);
    return ValidationOutcome(std::move(rejected));
  };

  if (raw.empty()) {
    return rejectWith(RejectionSignal::MissingValue);
  }

  if (raw.size() < rule.minLength() || raw.size() > rule.maxLength()) {
    return rejectWith(RejectionSignal::LengthViolation);
  }

  if (auto structural = checkStructure(rule, raw)) {
    RejectionDetail detail;
    detail.structuralRule = structural;
    return rejectWith(RejectionSignal::StructuralViolation, detail);
  }

  if (!rule.matches(raw)) {
    RejectionDetail detail;
    detail.offendingCharacter = rule.firstDisallowedCharacter(raw);
    return rejectWith(RejectionSignal::PatternViolation, detail);
  }

  auto findings = SecondarySanitizer::scan(raw, rule.pathLike());
  if (!findings.empty()) {
    RejectionDetail detail;
    detail.findings = std::move(findings);
    return rejectWith(RejectionSignal::UnsafeContent, detail);
  }

  return ValidationOutcome(Accepted{raw});
}

ValidationOutcome FieldValidator::validateName(const std::string &raw,
                                               const std::string &label) const {
  return validate(FieldKind::Name, raw, label);
}

ValidationOutcome
FieldValidator::validateIdentifier(const std::string &raw,
                                   const std::string &label) const {
  return validate(FieldKind::Identifier, raw, label);
}

ValidationOutcome
FieldValidator::validateToolName(const std::string &raw,
                                 const std::string &label) const {
  return validate(FieldKind::ToolName, raw, label);
}

ValidationOutcome FieldValidator::validateUri(const std::string &raw,
                                              const std::string &label) const {
  return validate(FieldKind::Uri, raw, label);
}

ValidationOutcome FieldValidator::validateUrl(const std::string &raw,
                                              const std::string &label) const {
  return validate(FieldKind::Url, raw, label);
}

ValidationOutcome FieldValidator::validateUuid(const std::string &raw,
                                               const std::string &label) const {
  return validate(FieldKind::Uuid, raw, label);
}

ValidationOutcome
FieldValidator::validateMimeType(const std::string &raw,
                                 const std::string &label) const {
  return validate(FieldKind::MimeType, raw, label);
}

ValidationReport
FieldValidator::validateFields(const std::vector<FieldInput> &fields) const {
  ValidationReport report;
  for (const auto &field : fields) {
    report.add(field.label, validate(field.kind, field.value, field.label));
  }
  return report;
}

std::string FieldValidator::require(FieldKind kind, const std::string &raw,
                                    const std::string &label) const {
  ValidationOutcome outcome = validate(kind, raw, label);
  if (outcome.isAccepted()) {
    return outcome.accepted().normalizedValue;
  }

  const Rejected &rejected = outcome.rejected();
  throw ValidationException(
      rejected.errorCode(), rejected.reason, label,
      {{"kind", fieldKindToString(kind)},
       {"signal", rejectionSignalToString(rejected.signal)}});
}

std::optional<StructuralRule>
FieldValidator::checkStructure(const ValidationRule &rule,
                               const std::string &value) {
  if (rule.mustStartWithLetter() && !isAsciiLetter(value.front())) {
    return StructuralRule::StartsWithLetter;
  }

  if (!rule.allowedSchemes().empty()) {
    if (auto schemeRule = checkScheme(rule, value)) {
      return schemeRule;
    }
  }

  if (rule.allows('%') && !hasValidPercentEncoding(value)) {
    return StructuralRule::InvalidPercentEncoding;
  }

  if (rule.kind() == FieldKind::Uuid && !hasUuidShape(value)) {
    return StructuralRule::UuidFormat;
  }

  if (rule.kind() == FieldKind::MimeType && !hasMimeTypeShape(value)) {
    return StructuralRule::MimeTypeFormat;
  }

  return std::nullopt;
}

std::optional<StructuralRule>
FieldValidator::checkScheme(const ValidationRule &rule,
                            const std::string &value) {
  // scheme = letter *( letter / digit / "+" / "-" / "." ) ":"
  size_t colon = value.find(':');
  if (colon == std::string::npos || colon == 0 || !isAsciiLetter(value[0])) {
    return StructuralRule::SchemeMissing;
  }
  for (size_t i = 1; i < colon; ++i) {
    char c = value[i];
    if (!isAsciiLetter(c) && !std::isdigit(static_cast<unsigned char>(c)) &&
        c != '+' && c != '-' && c != '.') {
      return StructuralRule::SchemeMissing;
    }
  }

  if (!rule.isSchemeAllowed(value.substr(0, colon))) {
    return StructuralRule::SchemeNotAllowed;
  }

  if (rule.kind() != FieldKind::Url) {
    return std::nullopt;
  }

  // Url: "//" authority, non-empty host, no userinfo
  if (value.compare(colon + 1, 2, "//") != 0) {
    return StructuralRule::HostMissing;
  }
  size_t authorityStart = colon + 3;
  size_t authorityEnd = value.find_first_of("/?#", authorityStart);
  std::string authority =
      value.substr(authorityStart, authorityEnd == std::string::npos
                                       ? std::string::npos
                                       : authorityEnd - authorityStart);
  if (authority.find('@') != std::string::npos) {
    return StructuralRule::CredentialsPresent;
  }
  std::string host = authority.substr(0, authority.find(':'));
  if (host.empty()) {
    return StructuralRule::HostMissing;
  }
  return std::nullopt;
}

bool FieldValidator::hasValidPercentEncoding(const std::string &value) {
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '%') {
      continue;
    }
    if (i + 2 >= value.size() || !isHexDigit(value[i + 1]) ||
        !isHexDigit(value[i + 2])) {
      return false;
    }
    i += 2;
  }
  return true;
}

bool FieldValidator::hasUuidShape(const std::string &value) {
  // Hyphen placement only; hex content is the pattern's job
  if (value.size() == 32) {
    return value.find('-') == std::string::npos;
  }
  if (value.size() == 36) {
    for (size_t i = 0; i < value.size(); ++i) {
      bool separator = (i == 8 || i == 13 || i == 18 || i == 23);
      if ((value[i] == '-') != separator) {
        return false;
      }
    }
    return true;
  }
  return false;
}

bool FieldValidator::hasMimeTypeShape(const std::string &value) {
  size_t slash = value.find('/');
  return slash != std::string::npos && slash > 0 &&
         slash + 1 < value.size() &&
         value.find('/', slash + 1) == std::string::npos;
}

void FieldValidator::logRejection(FieldKind kind, const Rejected &rejected) {
  LogContext context = {{"kind", fieldKindToString(kind)},
                        {"field", rejected.fieldName},
                        {"signal", rejectionSignalToString(rejected.signal)},
                        {"code", errorCodeToString(rejected.errorCode())}};

  if (isSecurityEvent(rejected.errorCode())) {
    context["security_event"] = "true";
    context["category"] = getErrorCategory(rejected.errorCode());
    std::string kinds;
    for (const auto &finding : rejected.findings) {
      if (!kinds.empty()) {
        kinds += ",";
      }
      kinds += findingKindToString(finding.kind);
    }
    context["findings"] = kinds;
    ValidatorLogger::warnWithContext("Unsafe content rejected", context);
    return;
  }

  if (rejected.structuralRule) {
    context["rule"] = structuralRuleToString(*rejected.structuralRule);
  }
  ValidatorLogger::debugWithContext("Field rejected", context);
}

} // namespace fieldguard
