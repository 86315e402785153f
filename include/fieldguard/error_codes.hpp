#pragma once

#include <functional> // Needed for std::hash
#include <string>
#include <type_traits>
#include <unordered_map>

namespace fieldguard {

// Error codes organized by category
enum class ErrorCode {
  // Input validation errors (1000-1999) - returned as rejections, never thrown
  // by the validation pipeline itself
  MISSING_VALUE = 1000,
  LENGTH_VIOLATION = 1001,
  STRUCTURAL_VIOLATION = 1002,
  PATTERN_VIOLATION = 1003,
  UNSAFE_CONTENT = 1004, // Potential attack, not a typo

  // Configuration errors (3000-3999)
  CONFIGURATION_ERROR = 3000,
  CONFIG_PARSE_ERROR = 3001,
  PATTERN_DRIFT = 3002, // Pattern and description disagree
  UNKNOWN_CHAR_CLASS = 3003,

  // Programmer errors (4000-4999)
  UNKNOWN_FIELD_KIND = 4000,
  INTERNAL_ERROR = 4001
};

// Error code metadata
struct ErrorCodeInfo {
  std::string description;
  std::string category;
  bool isSecurityEvent;
  int defaultHttpStatus;
};

const std::unordered_map<ErrorCode, ErrorCodeInfo> &getErrorCodeInfo();

} // namespace fieldguard

// Hash support for ErrorCode keys in unordered_map
namespace std {
template <> struct hash<fieldguard::ErrorCode> {
  size_t operator()(const fieldguard::ErrorCode code) const noexcept {
    using Underlying = std::underlying_type_t<fieldguard::ErrorCode>;
    return std::hash<Underlying>{}(static_cast<Underlying>(code));
  }
};
} // namespace std

namespace fieldguard {
// Utility functions
const char *getErrorCodeDescription(ErrorCode code);
std::string getErrorCategory(ErrorCode code);
bool isSecurityEvent(ErrorCode code);
int getDefaultHttpStatus(ErrorCode code);
std::string errorCodeToString(ErrorCode code);

} // namespace fieldguard
