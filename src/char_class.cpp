#include "fieldguard/char_class.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace fieldguard {

namespace {

bool isAsciiAlnum(size_t i) {
  return (i >= '0' && i <= '9') || (i >= 'a' && i <= 'z') ||
         (i >= 'A' && i <= 'Z');
}

// Same digit/lower/upper group, so a run never spans punctuation
int alnumGroup(size_t i) {
  if (i >= '0' && i <= '9')
    return 0;
  if (i >= 'a' && i <= 'z')
    return 1;
  return 2;
}

std::string hexEscape(size_t i) {
  std::ostringstream oss;
  oss << "\\x" << std::uppercase << std::hex << std::setw(2)
      << std::setfill('0') << i;
  return oss.str();
}

} // namespace

CharClass::CharClass(std::string name, const std::string &members)
    : name_(std::move(name)) {
  for (char c : members) {
    members_.set(charIndex(c));
  }
}

CharClass::CharClass(std::string name, const CharSet &members)
    : name_(std::move(name)), members_(members) {}

CharClass CharClass::fromRanges(std::string name,
                                const std::vector<std::pair<char, char>> &ranges,
                                const std::string &extra) {
  CharSet set;
  for (const auto &[first, last] : ranges) {
    for (size_t i = charIndex(first); i <= charIndex(last); ++i) {
      set.set(i);
    }
  }
  for (char c : extra) {
    set.set(charIndex(c));
  }
  return CharClass(std::move(name), set);
}

char CharClass::firstMember() const {
  for (size_t i = 0; i < members_.size(); ++i) {
    if (members_.test(i)) {
      return static_cast<char>(i);
    }
  }
  return '\0';
}

std::string CharClass::toRegexFragment() const {
  return regexFragmentFor(members_);
}

std::string regexFragmentFor(const CharSet &set) {
  std::string fragment;
  size_t i = 0;
  while (i < set.size()) {
    if (!set.test(i)) {
      ++i;
      continue;
    }

    if (isAsciiAlnum(i)) {
      size_t end = i;
      while (end + 1 < set.size() && set.test(end + 1) &&
             isAsciiAlnum(end + 1) && alnumGroup(end + 1) == alnumGroup(i)) {
        ++end;
      }
      if (end - i >= 2) {
        fragment += static_cast<char>(i);
        fragment += '-';
        fragment += static_cast<char>(end);
      } else {
        for (size_t j = i; j <= end; ++j) {
          fragment += static_cast<char>(j);
        }
      }
      i = end + 1;
      continue;
    }

    fragment += hexEscape(i);
    ++i;
  }
  return fragment;
}

std::string describeCharacter(char c) {
  auto byte = static_cast<unsigned char>(c);
  if (std::isprint(byte)) {
    return std::string("'") + c + "'";
  }
  std::ostringstream oss;
  oss << "0x" << std::uppercase << std::hex << std::setw(2)
      << std::setfill('0') << static_cast<int>(byte);
  return oss.str();
}

const std::vector<CharClass> &CharClassCatalog::all() {
  // Order matters for classify(): broad classes come before their subsets
  static const std::vector<CharClass> catalog = {
      CharClass::fromRanges("letters", {{'a', 'z'}, {'A', 'Z'}}),
      CharClass::fromRanges("numbers", {{'0', '9'}}),
      CharClass::fromRanges("lowercase letters", {{'a', 'z'}}),
      CharClass::fromRanges("uppercase letters", {{'A', 'Z'}}),
      CharClass::fromRanges("hexadecimal digits",
                            {{'0', '9'}, {'a', 'f'}, {'A', 'F'}}),
      CharClass("underscore", "_"),
      CharClass("hyphen", "-"),
      CharClass("dot", "."),
      CharClass("spaces", " "),
      CharClass("tilde", "~"),
      CharClass("colon", ":"),
      CharClass("slash", "/"),
      CharClass("question mark", "?"),
      CharClass("hash", "#"),
      CharClass("at sign", "@"),
      CharClass("ampersand", "&"),
      CharClass("equals sign", "="),
      CharClass("plus sign", "+"),
      CharClass("percent sign", "%"),
      CharClass("comma", ","),
      CharClass("semicolon", ";"),
      CharClass("exclamation mark", "!"),
      CharClass("asterisk", "*"),
      CharClass("dollar sign", "$"),
      CharClass("parentheses", "()"),
      CharClass("square brackets", "[]")};
  return catalog;
}

std::optional<CharClass> CharClassCatalog::find(const std::string &name) {
  for (const auto &cls : all()) {
    if (cls.name() == name) {
      return cls;
    }
  }
  return std::nullopt;
}

std::optional<std::string> CharClassCatalog::classify(char c) {
  for (const auto &cls : all()) {
    if (cls.contains(c)) {
      return cls.name();
    }
  }
  return std::nullopt;
}

} // namespace fieldguard
