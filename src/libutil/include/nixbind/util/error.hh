#pragma once
/**
 * @file
 *
 * @brief Exception types used throughout nixbind.
 *
 * Every nixbind exception derives from `BaseError`. Catch `Error`, or
 * one of the more specific subclasses declared with `MakeError`.
 */

#include "nixbind/util/fmt.hh"

#include <exception>
#include <string>

namespace nixbind {

class BaseError : public std::exception
{
    std::string msg_;

public:

    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : msg_(fmt(fs, args...))
    {
    }

    const char * what() const noexcept override
    {
        return msg_.c_str();
    }

    const std::string & msg() const
    {
        return msg_;
    }
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);

/**
 * The caller passed something nixbind or the engine cannot use, e.g. a
 * malformed configuration line or an unknown engine setting.
 */
MakeError(UsageError, Error);

/**
 * Process-wide initialisation of the engine failed. The failure is
 * permanent for the lifetime of the process.
 */
MakeError(InitError, Error);

} // namespace nixbind
