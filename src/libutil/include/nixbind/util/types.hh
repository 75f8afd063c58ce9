#pragma once
///@file

#include <list>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace nixbind {

typedef std::list<std::string> Strings;

/**
 * Ordered string map with a transparent comparator, so lookups by
 * `std::string_view` or `const char *` don't build temporaries.
 */
using StringMap = std::map<std::string, std::string, std::less<>>;

using StringSet = std::set<std::string, std::less<>>;

} // namespace nixbind
