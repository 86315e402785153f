#pragma once

#include "fieldguard/error_reporter.hpp"
#include "fieldguard/pattern_registry.hpp"
#include "fieldguard/validation_outcome.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fieldguard {

/**
 * @brief Entry point used by the gateway for every inbound field
 *
 * Checks run in a fixed order: presence, length, structural rules, character
 * pattern, then the secondary sanitizer. The first failing check decides the
 * rejection. Accepted values are returned unmodified.
 *
 * Holds only a shared, immutable registry; one instance may be used from any
 * number of threads.
 */
class FieldValidator {
public:
  FieldValidator();
  explicit FieldValidator(std::shared_ptr<const PatternRegistry> registry);

  /**
   * @brief Validate one raw value
   * @throws SystemException (UNKNOWN_FIELD_KIND) for an unregistered kind
   */
  ValidationOutcome validate(FieldKind kind, const std::string &raw,
                             const std::string &label) const;

  ValidationOutcome validateName(const std::string &raw,
                                 const std::string &label = "Name") const;
  ValidationOutcome
  validateIdentifier(const std::string &raw,
                     const std::string &label = "Identifier") const;
  ValidationOutcome
  validateToolName(const std::string &raw,
                   const std::string &label = "Tool name") const;
  ValidationOutcome validateUri(const std::string &raw,
                                const std::string &label = "URI") const;
  ValidationOutcome validateUrl(const std::string &raw,
                                const std::string &label = "URL") const;
  ValidationOutcome validateUuid(const std::string &raw,
                                 const std::string &label = "UUID") const;
  ValidationOutcome
  validateMimeType(const std::string &raw,
                   const std::string &label = "MIME type") const;

  // Validates every field and collects all rejections
  ValidationReport validateFields(const std::vector<FieldInput> &fields) const;

  /**
   * @brief Throwing variant of validate()
   * @return The accepted value
   * @throws ValidationException carrying the rejection reason and code
   */
  std::string require(FieldKind kind, const std::string &raw,
                      const std::string &label) const;

  const PatternRegistry &registry() const { return *registry_; }

private:
  std::shared_ptr<const PatternRegistry> registry_;

  static std::optional<StructuralRule>
  checkStructure(const ValidationRule &rule, const std::string &value);
  static std::optional<StructuralRule>
  checkScheme(const ValidationRule &rule, const std::string &value);
  static bool hasValidPercentEncoding(const std::string &value);
  static bool hasUuidShape(const std::string &value);
  static bool hasMimeTypeShape(const std::string &value);

  static void logRejection(FieldKind kind, const Rejected &rejected);
};

} // namespace fieldguard
