#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fieldguard {

// Semantic category of a validated field; each has its own rule
enum class FieldKind {
  Name,       // Display names: may contain spaces
  Identifier, // Machine identifiers: no whitespace
  ToolName,   // Must start with a letter
  Uri,        // Resource URIs with an allow-listed scheme
  Url,        // Network URLs: http(s)/ws(s) with a host
  Uuid,
  MimeType
};

const std::vector<FieldKind> &allFieldKinds();

// Lowercase snake_case key used in configuration ("tool_name")
std::string fieldKindToString(FieldKind kind);
std::optional<FieldKind> fieldKindFromString(const std::string &name);

} // namespace fieldguard
