#pragma once
///@file

#include "nixbind/expr/value.hh"
#include "nixbind/store/store.hh"
#include "nixbind/util/error-channel.hh"
#include "nixbind/util/types.hh"

#include <cstdint>
#include <memory>
#include <string>

#include "nix_api_expr.h"

namespace nixbind {

/**
 * An evaluator bound to a store.
 *
 * Evaluation happens on the calling thread, which must be registered
 * with the collector (see `withRegisteredThread`). A state is meant to be
 * used by one thread at a time.
 */
class EvalState
{
    struct StateDeleter
    {
        void operator()(::EvalState * state) const;
    };

    /* Declared before `state` so that the store is released last. */
    Store store;
    std::unique_ptr<::EvalState, StateDeleter> state;
    ErrorChannel channel;

public:

    /**
     * Create a state using the `lookup-path` setting.
     *
     * @throws UsageError if an entry of the setting contains a NUL byte.
     * @throws InitError if the evaluator could not be initialised.
     * @throws EngineError if the engine could not create the state.
     */
    explicit EvalState(Store store);

    /**
     * Create a state with an explicit lookup path, ignoring the
     * `lookup-path` setting.
     *
     * @param lookupPath Entries of the form `prefix=path` or `path`.
     * @throws UsageError if an entry contains a NUL byte.
     * @throws InitError if the evaluator could not be initialised.
     * @throws EngineError if the engine could not create the state.
     */
    EvalState(Store store, const Strings & lookupPath);

    EvalState(EvalState &&) = default;

    ::EvalState * raw() const
    {
        return state.get();
    }

    const Store & getStore() const
    {
        return store;
    }

    /**
     * Parse and evaluate `expr`. The result may still be a thunk.
     *
     * @param path The file the expression is reported as coming from;
     * relative paths in `expr` are resolved against its directory.
     * @throws UsageError if `expr` or `path` contains a NUL byte.
     * @throws EngineError if parsing or evaluation fails.
     */
    Value evalFromString(const std::string & expr, const std::string & path);

    /**
     * Evaluate `v` to weak head normal form, in place. Forcing an already
     * forced value does nothing.
     */
    void force(const Value & v);

    bool isThunk(const Value & v);

    /**
     * The type of `v`, forcing it first if needed. Never reports a thunk.
     */
    ValueType getType(const Value & v);

    /**
     * The contents of a string value. String context is not inspected.
     *
     * @throws WrongKindError if `v` is not a string.
     * @throws InvalidEncodingError if the contents are not valid UTF-8.
     */
    std::string requireString(const Value & v);

    int64_t requireInt(const Value & v);

    bool requireBool(const Value & v);

private:

    Value allocValue();

    std::string getString(const Value & v);

    void requireType(const Value & v, ValueType expected);
};

} // namespace nixbind
