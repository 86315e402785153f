#include "fieldguard/secondary_sanitizer.hpp"
#include <algorithm>

namespace fieldguard {

const std::regex SecondarySanitizer::htmlTagPattern_(R"(<[^<>]*>)");

const std::regex SecondarySanitizer::scriptPattern_(
    R"(<\s*/?\s*script|javascript\s*:|vbscript\s*:|data\s*:\s*text/html)",
    std::regex::ECMAScript | std::regex::icase);

// Group 2 is the handler itself; group 1 pins it to a word boundary so
// "button" or "cron=" do not count
const std::regex SecondarySanitizer::eventHandlerPattern_(
    R"((^|[^a-z0-9])(on(?:load|error|click|mouseover|mouseenter|focus|input|change|keypress|keydown|keyup)\s*=))",
    std::regex::ECMAScript | std::regex::icase);

// A ".." segment in any mix of literal and percent-encoded dots and
// separators. Group 1 is the dot pair; the lookahead leaves the trailing
// separator for the next segment.
const std::regex SecondarySanitizer::traversalPattern_(
    R"((?:^|[/\\]|%2f|%5c)((?:\.|%2e){2})(?=[/\\]|%2f|%5c|$))",
    std::regex::ECMAScript | std::regex::icase);

std::string findingKindToString(FindingKind kind) {
  switch (kind) {
  case FindingKind::HtmlTag:
    return "html tag";
  case FindingKind::ScriptTag:
    return "script injection";
  case FindingKind::PathTraversal:
    return "path traversal";
  case FindingKind::ControlChar:
    return "control character";
  default:
    return "unknown";
  }
}

void SecondarySanitizer::collect(const std::string &value,
                                 const std::regex &pattern, FindingKind kind,
                                 size_t group,
                                 std::vector<SanitizationFinding> &findings) {
  auto begin = std::sregex_iterator(value.begin(), value.end(), pattern);
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    const std::smatch &match = *it;
    findings.push_back({kind, static_cast<size_t>(match.position(group)),
                        static_cast<size_t>(match.length(group)),
                        match.str(group)});
  }
}

std::vector<SanitizationFinding>
SecondarySanitizer::scan(const std::string &value, bool pathLike) {
  std::vector<SanitizationFinding> findings;

  collect(value, scriptPattern_, FindingKind::ScriptTag, 0, findings);
  collect(value, eventHandlerPattern_, FindingKind::ScriptTag, 2, findings);
  collect(value, htmlTagPattern_, FindingKind::HtmlTag, 0, findings);

  for (size_t i = 0; i < value.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(value[i]);
    if (c < 0x20 || c == 0x7F) {
      findings.push_back({FindingKind::ControlChar, i, 1, value.substr(i, 1)});
    }
  }

  if (pathLike) {
    collect(value, traversalPattern_, FindingKind::PathTraversal, 1, findings);
  }

  std::stable_sort(findings.begin(), findings.end(),
                   [](const SanitizationFinding &a,
                      const SanitizationFinding &b) {
                     return a.offset < b.offset;
                   });
  return findings;
}

} // namespace fieldguard
