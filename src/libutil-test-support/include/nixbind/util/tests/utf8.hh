#pragma once
///@file

#include <cstdint>
#include <string>
#include <vector>

namespace nixbind {

/**
 * The UTF-8 encoding of the code point `cp`, which must be at most
 * U+10FFFF.
 */
std::string encodeUTF8(uint32_t cp);

/**
 * Map arbitrary generated integers onto Unicode scalar values (no
 * surrogates, nothing above U+10FFFF) and encode them as one UTF-8
 * string. Values below `min` are moved up to it.
 */
std::string encodeScalarValues(const std::vector<uint32_t> & raw, uint32_t min = 0);

} // namespace nixbind
