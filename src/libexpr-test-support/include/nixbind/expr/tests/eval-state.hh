#pragma once
///@file

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "nixbind/expr/eval-state.hh"
#include "nixbind/expr/gc.hh"
#include "nixbind/store/tests/store.hh"

namespace nixbind {

/**
 * An evaluator bound to a temporary local store, with an empty lookup
 * path.
 */
class EvalStateTest : public LocalStoreTest
{
protected:

    EvalStateTest()
        : state(openLocalStore(), Strings{})
    {
    }

    /**
     * Evaluate `input` without forcing the result.
     */
    Value eval(const std::string & input)
    {
        return state.evalFromString(input, "<test>");
    }

    EvalState state;
};

MATCHER_P(HasType, type, "")
{
    *result_listener << "where the actual type is " << arg;
    return arg == type;
}

} // namespace nixbind
