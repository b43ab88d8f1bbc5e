#include "util/wildcard.hpp"

#include <regex>

namespace adoi {

namespace {

/**
 * Convert a wildcard pattern to a case-insensitive regular expression.
 *
 * @param glob Pattern containing '*' and '?' wildcards.
 * @return Anchored std::regex with the same matching semantics.
 */
std::regex glob_to_regex(const std::string &glob) {
  std::string rx = "^";
  for (char c : glob) {
    switch (c) {
    case '*':
      rx += ".*";
      break;
    case '?':
      rx += '.';
      break;
    case '.':
    case '+':
    case '(':
    case ')':
    case '{':
    case '}':
    case '^':
    case '$':
    case '|':
    case '\\':
    case '[':
    case ']':
      rx += '\\';
      rx += c;
      break;
    default:
      rx += c;
    }
  }
  rx += '$';
  return std::regex(rx, std::regex::ECMAScript | std::regex::icase);
}

} // namespace

bool wildcard_match(const std::string &name, const std::string &pattern) {
  return std::regex_match(name, glob_to_regex(pattern));
}

bool matches_any(const std::string &name,
                 const std::vector<std::string> &patterns) {
  if (patterns.empty()) {
    return true;
  }
  return std::any_of(patterns.begin(), patterns.end(),
                     [&name](const std::string &pattern) {
                       return wildcard_match(name, pattern);
                     });
}

} // namespace adoi
