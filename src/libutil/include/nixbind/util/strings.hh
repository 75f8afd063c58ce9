#pragma once
///@file

#include "nixbind/util/types.hh"

#include <optional>
#include <string>
#include <string_view>

namespace nixbind {

/**
 * Split `s` at any of the characters in `separators`. Empty tokens are
 * dropped.
 */
Strings tokenizeString(std::string_view s, std::string_view separators = " \t\n\r");

std::string concatStringsSep(std::string_view sep, const Strings & ss);

bool hasPrefix(std::string_view s, std::string_view prefix);

/**
 * Lower-case the ASCII letters of `s`; other bytes are left alone.
 */
std::string toLower(std::string s);

/**
 * Find the first byte that does not start a well-formed UTF-8
 * sequence. Overlong encodings, surrogate halves and code points above
 * U+10FFFF count as malformed.
 *
 * @return the byte offset of the offending sequence, or `std::nullopt`
 * if `s` is valid UTF-8.
 */
std::optional<size_t> findInvalidUTF8(std::string_view s);

} // namespace nixbind
