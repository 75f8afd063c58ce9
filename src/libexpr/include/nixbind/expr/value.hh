#pragma once
///@file

#include "nixbind/util/error.hh"

#include <ostream>
#include <string_view>

#include "nix_api_value.h"

namespace nixbind {

/**
 * The type of a forced value.
 */
enum class ValueType {
    Integer,
    Float,
    Bool,
    String,
    Path,
    Null,
    AttrSet,
    List,
    Function,
    External,
    /**
     * A type this library does not know about.
     */
    Unknown,
};

/**
 * The name of a value type as it appears in error messages, e.g.
 * "AttrSet".
 */
std::string_view showType(ValueType type);

std::ostream & operator<<(std::ostream & str, ValueType type);

/**
 * Extracting a native value from an engine value failed.
 */
MakeError(ExtractionError, Error);

class WrongKindError : public ExtractionError
{
    ValueType expected_;
    ValueType actual_;

public:

    WrongKindError(ValueType expected, ValueType actual);

    ValueType expected() const
    {
        return expected_;
    }

    ValueType actual() const
    {
        return actual_;
    }
};

/**
 * A string from the engine is not valid UTF-8.
 */
MakeError(InvalidEncodingError, ExtractionError);

/**
 * A reference to a value on the engine's heap.
 *
 * Copies are cheap and refer to the same heap value: forcing through one
 * copy is observed by all of them. The engine reclaims the value once no
 * handle refers to it and the collector finds it unreachable.
 *
 * A value is only meaningful to the `EvalState` that produced it, which
 * must outlive it.
 */
class Value
{
    nix_value * value;

public:

    /**
     * Take over one reference held by the caller.
     */
    explicit Value(nix_value * value);

    Value(const Value & other);
    Value(Value && other) noexcept;

    Value & operator=(Value other) noexcept;

    ~Value();

    nix_value * raw() const
    {
        return value;
    }

    bool operator==(const Value & other) const
    {
        return value == other.value;
    }
};

} // namespace nixbind
