#include "fieldguard/field_kind.hpp"

namespace fieldguard {

const std::vector<FieldKind> &allFieldKinds() {
  static const std::vector<FieldKind> kinds = {
      FieldKind::Name, FieldKind::Identifier, FieldKind::ToolName,
      FieldKind::Uri,  FieldKind::Url,        FieldKind::Uuid,
      FieldKind::MimeType};
  return kinds;
}

std::string fieldKindToString(FieldKind kind) {
  switch (kind) {
  case FieldKind::Name:
    return "name";
  case FieldKind::Identifier:
    return "identifier";
  case FieldKind::ToolName:
    return "tool_name";
  case FieldKind::Uri:
    return "uri";
  case FieldKind::Url:
    return "url";
  case FieldKind::Uuid:
    return "uuid";
  case FieldKind::MimeType:
    return "mime_type";
  default:
    return "unknown";
  }
}

std::optional<FieldKind> fieldKindFromString(const std::string &name) {
  for (FieldKind kind : allFieldKinds()) {
    if (fieldKindToString(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

} // namespace fieldguard
