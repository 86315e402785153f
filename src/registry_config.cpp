#include "fieldguard/registry_config.hpp"
#include "fieldguard/exceptions.hpp"

namespace fieldguard {

namespace {

std::vector<CharClassEntry> entries(
    const std::vector<std::pair<std::string, char>> &classAndExample) {
  std::vector<CharClassEntry> result;
  result.reserve(classAndExample.size());
  for (const auto &[className, example] : classAndExample) {
    result.push_back(catalogEntry(className, example));
  }
  return result;
}

std::vector<CharClassEntry> uriClasses() {
  return entries({{"letters", 'a'},
                  {"numbers", '0'},
                  {"underscore", '_'},
                  {"hyphen", '-'},
                  {"dot", '.'},
                  {"tilde", '~'},
                  {"colon", ':'},
                  {"slash", '/'},
                  {"question mark", '?'},
                  {"hash", '#'},
                  {"at sign", '@'},
                  {"ampersand", '&'},
                  {"equals sign", '='},
                  {"plus sign", '+'},
                  {"percent sign", '%'}});
}

} // namespace

CharClassEntry catalogEntry(const std::string &className,
                            char literalExample) {
  auto cls = CharClassCatalog::find(className);
  if (!cls) {
    throw ConfigException(ErrorCode::UNKNOWN_CHAR_CLASS,
                          "Unknown character class: " + className, "",
                          {{"class", className}});
  }
  if (!cls->contains(literalExample)) {
    throw ConfigException(ErrorCode::PATTERN_DRIFT,
                          "Example " + describeCharacter(literalExample) +
                              " is not a member of character class '" +
                              className + "'",
                          "", {{"class", className}});
  }
  return CharClassEntry{*cls, literalExample};
}

RuleSpec RegistryConfig::defaultRule(FieldKind kind) {
  RuleSpec rule;

  switch (kind) {
  case FieldKind::Name:
    rule.classes = entries({{"letters", 'a'},
                            {"numbers", '0'},
                            {"underscore", '_'},
                            {"hyphen", '-'},
                            {"dot", '.'},
                            {"spaces", ' '}});
    break;
  case FieldKind::Identifier:
    rule.classes = entries({{"letters", 'a'},
                            {"numbers", '0'},
                            {"underscore", '_'},
                            {"hyphen", '-'},
                            {"dot", '.'}});
    break;
  case FieldKind::ToolName:
    rule.classes = entries({{"letters", 'a'},
                            {"numbers", '0'},
                            {"underscore", '_'},
                            {"hyphen", '-'},
                            {"dot", '.'}});
    rule.mustStartWithLetter = true;
    break;
  case FieldKind::Uri:
    rule.classes = uriClasses();
    rule.maxLength = 2048;
    rule.pathLike = true;
    rule.allowedSchemes = {"http", "https", "ws", "wss", "file"};
    break;
  case FieldKind::Url:
    rule.classes = uriClasses();
    rule.maxLength = 2048;
    rule.pathLike = true;
    rule.allowedSchemes = {"http", "https", "ws", "wss"};
    break;
  case FieldKind::Uuid:
    rule.classes = entries({{"hexadecimal digits", 'a'}, {"hyphen", '-'}});
    rule.minLength = 32;
    rule.maxLength = 36;
    break;
  case FieldKind::MimeType:
    rule.classes = entries({{"letters", 'a'},
                            {"numbers", '0'},
                            {"hyphen", '-'},
                            {"dot", '.'},
                            {"plus sign", '+'},
                            {"underscore", '_'},
                            {"slash", '/'}});
    rule.minLength = 3;
    break;
  default:
    throw SystemException(ErrorCode::UNKNOWN_FIELD_KIND,
                          "No default rule for field kind " +
                              std::to_string(static_cast<int>(kind)),
                          "RegistryConfig");
  }

  return rule;
}

RegistryConfig RegistryConfig::defaults() {
  RegistryConfig config;
  for (FieldKind kind : allFieldKinds()) {
    config.rules[kind] = defaultRule(kind);
  }
  return config;
}

} // namespace fieldguard
