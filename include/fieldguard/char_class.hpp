#pragma once

#include <bitset>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fieldguard {

using CharSet = std::bitset<256>;

inline size_t charIndex(char c) { return static_cast<unsigned char>(c); }

/**
 * @brief A named set of accepted bytes
 *
 * The name is what users read in rejection messages ("letters", "dot"); the
 * member set is what the generated regex fragment matches. Both live in one
 * object so a class cannot describe characters it does not match.
 */
class CharClass {
public:
  CharClass(std::string name, const std::string &members);
  CharClass(std::string name, const CharSet &members);

  // Inclusive ranges plus individual extra members
  static CharClass fromRanges(std::string name,
                              const std::vector<std::pair<char, char>> &ranges,
                              const std::string &extra = "");

  const std::string &name() const { return name_; }
  const CharSet &members() const { return members_; }
  bool contains(char c) const { return members_.test(charIndex(c)); }
  bool empty() const { return members_.none(); }
  char firstMember() const;

  // Bracket-expression content for this class, without the brackets
  std::string toRegexFragment() const;

  bool operator==(const CharClass &other) const {
    return name_ == other.name_ && members_ == other.members_;
  }
  bool operator!=(const CharClass &other) const { return !(*this == other); }

private:
  std::string name_;
  CharSet members_;
};

// Bracket-expression content matching exactly the bytes in `set`.
// Alphanumeric runs become ranges; everything else is emitted as \xHH so no
// member can be mistaken for bracket syntax.
std::string regexFragmentFor(const CharSet &set);

// Printable form of a byte for messages: 'a', or 0x00 for non-printables
std::string describeCharacter(char c);

/**
 * @brief Built-in character classes that configuration may reference by name
 *
 * Deliberately excludes angle brackets, quotes and backslash.
 */
class CharClassCatalog {
public:
  static const std::vector<CharClass> &all();
  static std::optional<CharClass> find(const std::string &name);

  // Name of the first catalog class containing c
  static std::optional<std::string> classify(char c);
};

} // namespace fieldguard
