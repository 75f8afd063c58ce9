#pragma once
///@file

#include <string>

namespace nixbind {

/**
 * A `nix_get_string_callback` that copies the `n` bytes at `start` into
 * the `std::string` passed as `user_data`.
 */
void receiveString(const char * start, unsigned int n, void * user_data);

inline void * receiveStringData(std::string & out)
{
    return static_cast<void *>(&out);
}

/**
 * Expands to the callback and user-data arguments of engine calls that
 * report a string, e.g.
 *
 *   std::string s;
 *   nix_get_string(ctx, value, NIXBIND_RECEIVE_STRING(s));
 */
#define NIXBIND_RECEIVE_STRING(str) nixbind::receiveString, nixbind::receiveStringData(str)

} // namespace nixbind
