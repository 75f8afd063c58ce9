#pragma once
///@file

#include <boost/format.hpp>
#include <string>

namespace nixbind {

/**
 * Format `fs` with `boost::format` placeholders (`%s`, `%d`, `%1%`).
 *
 * Without arguments `fs` is returned as is, so engine and user text
 * passed alone is never read as a format string. Missing or surplus
 * arguments are tolerated; a malformed format string throws
 * `boost::io::format_error`.
 */
template<typename... Args>
std::string fmt(const std::string & fs, const Args &... args)
{
    if constexpr (sizeof...(Args) == 0)
        return fs;
    else {
        boost::format f(fs);
        f.exceptions(boost::io::all_error_bits ^ boost::io::too_many_args_bit ^ boost::io::too_few_args_bit);
        (f % ... % args);
        return f.str();
    }
}

} // namespace nixbind
