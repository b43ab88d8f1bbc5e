/**
 * @file wildcard.hpp
 * @brief Case-insensitive wildcard matching for project, repository and
 * variable group name filters.
 */
#ifndef ADOINVENTORY_UTIL_WILDCARD_HPP
#define ADOINVENTORY_UTIL_WILDCARD_HPP

#include <algorithm>
#include <string>
#include <vector>

namespace adoi {

/**
 * Match a name against a wildcard pattern.
 *
 * `*` matches any run of characters (including none) and `?` matches exactly
 * one character. Comparison ignores ASCII case. Every other character is
 * literal, so `.` or `[` in a project name need no escaping.
 *
 * @param name Candidate name.
 * @param pattern Wildcard pattern.
 * @return True when the whole name matches.
 */
bool wildcard_match(const std::string &name, const std::string &pattern);

/**
 * Check a name against a list of patterns.
 *
 * @param name Candidate name.
 * @param patterns Wildcard patterns; an empty list matches everything.
 * @return True when the list is empty or any pattern matches.
 */
bool matches_any(const std::string &name,
                 const std::vector<std::string> &patterns);

/**
 * Keep the items whose name matches any of the patterns.
 *
 * @param items Items to filter, preserving their order.
 * @param patterns Wildcard patterns; empty keeps every item.
 * @param name_of Projection returning the name of an item.
 */
template <typename T, typename NameOf>
std::vector<T> filter_by_patterns(std::vector<T> items,
                                  const std::vector<std::string> &patterns,
                                  NameOf name_of) {
  if (patterns.empty()) {
    return items;
  }
  items.erase(std::remove_if(items.begin(), items.end(),
                             [&](const T &item) {
                               return !matches_any(name_of(item), patterns);
                             }),
              items.end());
  return items;
}

} // namespace adoi

#endif // ADOINVENTORY_UTIL_WILDCARD_HPP
