#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

namespace fieldguard {

enum class FindingKind { HtmlTag, ScriptTag, PathTraversal, ControlChar };

std::string findingKindToString(FindingKind kind);

struct SanitizationFinding {
  FindingKind kind;
  size_t offset;
  size_t length;
  std::string matched;

  bool operator==(const SanitizationFinding &other) const {
    return kind == other.kind && offset == other.offset &&
           length == other.length && matched == other.matched;
  }
  bool operator!=(const SanitizationFinding &other) const {
    return !(*this == other);
  }
};

/**
 * @brief Pattern-independent injection checks
 *
 * Runs after the character pattern so that a broadened or misconfigured rule
 * cannot on its own let markup, scripts or traversal sequences through.
 * Stateless and thread-safe.
 */
class SecondarySanitizer {
public:
  /**
   * @brief Scan a value for unsafe content
   * @param value Raw field value
   * @param pathLike Also report directory traversal sequences
   * @return Findings ordered by offset; empty when the value is clean
   */
  static std::vector<SanitizationFinding> scan(const std::string &value,
                                               bool pathLike = false);

  static bool isClean(const std::string &value, bool pathLike = false) {
    return scan(value, pathLike).empty();
  }

private:
  static void collect(const std::string &value, const std::regex &pattern,
                      FindingKind kind, size_t group,
                      std::vector<SanitizationFinding> &findings);

  static const std::regex htmlTagPattern_;
  static const std::regex scriptPattern_;
  static const std::regex eventHandlerPattern_;
  static const std::regex traversalPattern_;
};

} // namespace fieldguard
