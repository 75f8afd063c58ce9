#include "nixbind/expr/value.hh"
#include "nixbind/util/error-channel.hh"
#include "nixbind/util/logging.hh"
#include "nixbind/util/strings.hh"

#include <string>
#include <utility>

namespace nixbind {

std::string_view showType(ValueType type)
{
    switch (type) {
    case ValueType::Integer:
        return "Integer";
    case ValueType::Float:
        return "Float";
    case ValueType::Bool:
        return "Bool";
    case ValueType::String:
        return "String";
    case ValueType::Path:
        return "Path";
    case ValueType::Null:
        return "Null";
    case ValueType::AttrSet:
        return "AttrSet";
    case ValueType::List:
        return "List";
    case ValueType::Function:
        return "Function";
    case ValueType::External:
        return "External";
    default:
        return "Unknown";
    }
}

std::ostream & operator<<(std::ostream & str, ValueType type)
{
    return str << showType(type);
}

WrongKindError::WrongKindError(ValueType expected, ValueType actual)
    : ExtractionError(
          "expected a %s, but got a %s", toLower(std::string(showType(expected))), std::string(showType(actual)))
    , expected_(expected)
    , actual_(actual)
{
}

Value::Value(nix_value * value)
    : value(value)
{
}

Value::Value(const Value & other)
    : value(other.value)
{
    ErrorChannel channel;
    nix_value_incref(channel.ptr(), value);
    channel.check();
}

Value::Value(Value && other) noexcept
    : value(other.value)
{
    other.value = nullptr;
}

Value & Value::operator=(Value other) noexcept
{
    std::swap(value, other.value);
    return *this;
}

Value::~Value()
{
    if (!value)
        return;
    try {
        ErrorChannel channel;
        nix_value_decref(channel.ptr(), value);
        channel.check();
    } catch (std::exception & e) {
        printError("failed to release a value reference: %s", e.what());
    }
}

} // namespace nixbind
