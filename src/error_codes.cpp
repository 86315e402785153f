#include "fieldguard/error_codes.hpp"

namespace fieldguard {

const std::unordered_map<ErrorCode, ErrorCodeInfo> &getErrorCodeInfo() {
  static const std::unordered_map<ErrorCode, ErrorCodeInfo> errorInfo = {
      // Input validation errors
      {ErrorCode::MISSING_VALUE,
       {"Required value is missing or empty", "Validation", false,
        400 // Bad Request
       }},
      {ErrorCode::LENGTH_VIOLATION,
       {"Value length is outside the allowed bounds", "Validation", false,
        400}},
      {ErrorCode::STRUCTURAL_VIOLATION,
       {"Value does not have the required structure", "Validation", false,
        400}},
      {ErrorCode::PATTERN_VIOLATION,
       {"Value contains characters that are not allowed", "Validation", false,
        400}},
      {ErrorCode::UNSAFE_CONTENT,
       {"Value contains potentially unsafe content", "Security",
        true, // Reported separately from benign typos
        400}},

      // Configuration errors
      {ErrorCode::CONFIGURATION_ERROR,
       {"Validator configuration is invalid", "Configuration", false,
        500 // Internal Server Error
       }},
      {ErrorCode::CONFIG_PARSE_ERROR,
       {"Validator configuration could not be parsed", "Configuration", false,
        500}},
      {ErrorCode::PATTERN_DRIFT,
       {"Pattern and allowed-character description disagree", "Configuration",
        false, 500}},
      {ErrorCode::UNKNOWN_CHAR_CLASS,
       {"Configuration references an unknown character class",
        "Configuration", false, 500}},

      // Programmer errors
      {ErrorCode::UNKNOWN_FIELD_KIND,
       {"No validation rule is registered for the field kind", "Programming",
        false, 500}},
      {ErrorCode::INTERNAL_ERROR,
       {"Unexpected internal error", "System", false, 500}}};

  return errorInfo;
}

const char *getErrorCodeDescription(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  return (it != info.end()) ? it->second.description.c_str() : "Unknown error";
}

std::string getErrorCategory(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  return (it != info.end()) ? it->second.category : "Unknown";
}

bool isSecurityEvent(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  return (it != info.end()) ? it->second.isSecurityEvent : false;
}

int getDefaultHttpStatus(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  return (it != info.end()) ? it->second.defaultHttpStatus : 500;
}

std::string errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::MISSING_VALUE:
    return "MISSING_VALUE";
  case ErrorCode::LENGTH_VIOLATION:
    return "LENGTH_VIOLATION";
  case ErrorCode::STRUCTURAL_VIOLATION:
    return "STRUCTURAL_VIOLATION";
  case ErrorCode::PATTERN_VIOLATION:
    return "PATTERN_VIOLATION";
  case ErrorCode::UNSAFE_CONTENT:
    return "UNSAFE_CONTENT";
  case ErrorCode::CONFIGURATION_ERROR:
    return "CONFIGURATION_ERROR";
  case ErrorCode::CONFIG_PARSE_ERROR:
    return "CONFIG_PARSE_ERROR";
  case ErrorCode::PATTERN_DRIFT:
    return "PATTERN_DRIFT";
  case ErrorCode::UNKNOWN_CHAR_CLASS:
    return "UNKNOWN_CHAR_CLASS";
  case ErrorCode::UNKNOWN_FIELD_KIND:
    return "UNKNOWN_FIELD_KIND";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  default:
    return "UNKNOWN_ERROR";
  }
}

} // namespace fieldguard
