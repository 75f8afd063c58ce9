#include "nixbind/expr/eval-state.hh"
#include "nixbind/expr/eval-settings.hh"
#include "nixbind/expr/init.hh"
#include "nixbind/util/logging.hh"
#include "nixbind/util/string-callback.hh"
#include "nixbind/util/strings.hh"

#include <vector>

namespace nixbind {

void EvalState::StateDeleter::operator()(::EvalState * state) const
{
    debug("freeing evaluator state");
    nix_state_free(state);
}

static ValueType convertType(::ValueType type)
{
    switch (type) {
    case NIX_TYPE_INT:
        return ValueType::Integer;
    case NIX_TYPE_FLOAT:
        return ValueType::Float;
    case NIX_TYPE_BOOL:
        return ValueType::Bool;
    case NIX_TYPE_STRING:
        return ValueType::String;
    case NIX_TYPE_PATH:
        return ValueType::Path;
    case NIX_TYPE_NULL:
        return ValueType::Null;
    case NIX_TYPE_ATTRS:
        return ValueType::AttrSet;
    case NIX_TYPE_LIST:
        return ValueType::List;
    case NIX_TYPE_FUNCTION:
        return ValueType::Function;
    case NIX_TYPE_EXTERNAL:
        return ValueType::External;
    default:
        return ValueType::Unknown;
    }
}

static void checkNoNul(const std::string & s, std::string_view what)
{
    if (s.find('\0') != std::string::npos)
        throw UsageError("%s contains a NUL byte", what);
}

EvalState::EvalState(Store store)
    : EvalState(std::move(store), evalSettings.lookupPath.get())
{
}

EvalState::EvalState(Store store, const Strings & lookupPath)
    : store(std::move(store))
{
    ensureInitialized();

    std::vector<const char *> lookupPathPtrs;
    for (auto & entry : lookupPath) {
        checkNoNul(entry, "lookup path entry");
        lookupPathPtrs.push_back(entry.c_str());
    }
    lookupPathPtrs.push_back(nullptr);

    state.reset(nix_state_create(channel.ptr(), lookupPathPtrs.data(), this->store.raw()));
    channel.check();
    if (!state)
        throw EngineError(NIX_ERR_UNKNOWN, "nix_state_create returned a null pointer");

    debug("created evaluator state with %d lookup path entries", lookupPath.size());
}

Value EvalState::allocValue()
{
    auto * v = nix_alloc_value(channel.ptr(), raw());
    channel.check();
    if (!v)
        throw EngineError(NIX_ERR_UNKNOWN, "nix_alloc_value returned a null pointer");
    return Value(v);
}

Value EvalState::evalFromString(const std::string & expr, const std::string & path)
{
    checkNoNul(expr, "expression");
    checkNoNul(path, "source path");

    auto v = allocValue();
    nix_expr_eval_from_string(channel.ptr(), raw(), expr.c_str(), path.c_str(), v.raw());
    channel.check();
    return v;
}

void EvalState::force(const Value & v)
{
    nix_value_force(channel.ptr(), raw(), v.raw());
    channel.check();
}

bool EvalState::isThunk(const Value & v)
{
    auto type = nix_get_type(channel.ptr(), v.raw());
    channel.check();
    return type == NIX_TYPE_THUNK;
}

ValueType EvalState::getType(const Value & v)
{
    auto type = nix_get_type(channel.ptr(), v.raw());
    channel.check();
    if (type == NIX_TYPE_THUNK) {
        force(v);
        type = nix_get_type(channel.ptr(), v.raw());
        channel.check();
    }
    return convertType(type);
}

void EvalState::requireType(const Value & v, ValueType expected)
{
    auto actual = getType(v);
    if (actual != expected)
        throw WrongKindError(expected, actual);
}

std::string EvalState::getString(const Value & v)
{
    std::string res;
    nix_get_string(channel.ptr(), v.raw(), NIXBIND_RECEIVE_STRING(res));
    channel.check();
    return res;
}

std::string EvalState::requireString(const Value & v)
{
    requireType(v, ValueType::String);
    auto s = getString(v);
    if (auto offset = findInvalidUTF8(s))
        throw InvalidEncodingError("Nix string is not valid UTF-8: invalid byte sequence at offset %d", *offset);
    return s;
}

int64_t EvalState::requireInt(const Value & v)
{
    requireType(v, ValueType::Integer);
    auto n = nix_get_int(channel.ptr(), v.raw());
    channel.check();
    return n;
}

bool EvalState::requireBool(const Value & v)
{
    requireType(v, ValueType::Bool);
    auto b = nix_get_bool(channel.ptr(), v.raw());
    channel.check();
    return b;
}

} // namespace nixbind
