#pragma once

#include "fieldguard/error_codes.hpp"
#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>

namespace fieldguard {

// Error context for additional debugging information
using ErrorContext = std::unordered_map<std::string, std::string>;

// Base exception with error context and correlation ID support.
//
// Only configuration and programmer errors are thrown; rejected user input
// travels as a ValidationOutcome value unless the caller opts into
// FieldValidator::require.
class FieldGuardException : public std::exception {
public:
  FieldGuardException(ErrorCode code, std::string message,
                      ErrorContext context = {});

  FieldGuardException(const FieldGuardException &other) = default;
  FieldGuardException &operator=(const FieldGuardException &other) = default;
  FieldGuardException(FieldGuardException &&other) noexcept = default;
  FieldGuardException &operator=(FieldGuardException &&other) noexcept = default;

  virtual ~FieldGuardException() = default;

  ErrorCode getCode() const { return errorCode_; }
  const std::string &getMessage() const { return message_; }
  const ErrorContext &getContext() const { return context_; }
  const std::string &getCorrelationId() const { return correlationId_; }
  std::chrono::system_clock::time_point getTimestamp() const {
    return timestamp_;
  }

  const char *what() const noexcept override { return message_.c_str(); }

  // Serialization for logging and API responses
  virtual std::string toLogString() const;
  std::string toJsonString() const;

  void addContext(const std::string &key, const std::string &value);
  void setCorrelationId(const std::string &correlationId);

protected:
  ErrorCode errorCode_;
  std::string message_;
  ErrorContext context_;
  std::string correlationId_;
  std::chrono::system_clock::time_point timestamp_;

  static std::string generateCorrelationId();
};

// Rejected input surfaced through the throwing API
class ValidationException : public FieldGuardException {
public:
  ValidationException(ErrorCode code, std::string message,
                      std::string field = "", ErrorContext context = {});

  const std::string &getField() const { return field_; }

  std::string toLogString() const override;

private:
  std::string field_;
};

// Invalid rule table, unparsable config file, failed pattern self-test
class ConfigException : public FieldGuardException {
public:
  ConfigException(ErrorCode code, std::string message,
                  std::string section = "", ErrorContext context = {});

  const std::string &getSection() const { return section_; }

  std::string toLogString() const override;

private:
  std::string section_;
};

// Programmer errors such as an unregistered field kind
class SystemException : public FieldGuardException {
public:
  SystemException(ErrorCode code, std::string message,
                  std::string component = "", ErrorContext context = {});

  const std::string &getComponent() const { return component_; }

  std::string toLogString() const override;

private:
  std::string component_;
};

// Exception type checking
bool isValidationError(const std::exception &ex);
bool isConfigError(const std::exception &ex);
bool isSystemError(const std::exception &ex);

template <typename ExceptionType>
const ExceptionType *asException(const std::exception &ex) {
  return dynamic_cast<const ExceptionType *>(&ex);
}

} // namespace fieldguard
