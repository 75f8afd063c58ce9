#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <rapidcheck/gtest.h>

#include <filesystem>
#include <sstream>
#include <utility>
#include <vector>

#include "nixbind/expr/eval-settings.hh"
#include "nixbind/expr/eval-state.hh"
#include "nixbind/expr/tests/eval-state.hh"
#include "nixbind/util/tests/utf8.hh"

namespace nixbind {

using testing::HasSubstr;
using testing::StartsWith;

/* ----------------------------------------------------------------------------
 * evalFromString, force, getType
 * --------------------------------------------------------------------------*/

TEST_F(EvalStateTest, evalInteger)
{
    auto v = eval("1");
    state.force(v);
    ASSERT_THAT(state.getType(v), HasType(ValueType::Integer));
    ASSERT_EQ(state.requireInt(v), 1);
}

TEST_F(EvalStateTest, forcedValueIsNotAThunk)
{
    auto v = eval("1 + 1");
    state.force(v);
    ASSERT_FALSE(state.isThunk(v));
}

TEST_F(EvalStateTest, forceIsIdempotent)
{
    auto v = eval("{ a = 1; }");
    state.force(v);
    auto first = state.getType(v);
    ASSERT_NO_THROW(state.force(v));
    ASSERT_EQ(state.getType(v), first);
    ASSERT_EQ(first, ValueType::AttrSet);
}

TEST_F(EvalStateTest, getTypeForcesImplicitly)
{
    auto v = eval("let x = 2 * 21; in x");
    ASSERT_EQ(state.getType(v), ValueType::Integer);
    ASSERT_FALSE(state.isThunk(v));
    ASSERT_EQ(state.requireInt(v), 42);
}

TEST_F(EvalStateTest, copiedValueHasSameType)
{
    auto v = eval("1");
    state.force(v);
    auto copy = v;
    ASSERT_EQ(copy, v);
    ASSERT_EQ(state.getType(copy), ValueType::Integer);
}

TEST_F(EvalStateTest, evalBool)
{
    auto v = eval("true");
    state.force(v);
    ASSERT_EQ(state.getType(v), ValueType::Bool);
    ASSERT_EQ(state.requireBool(v), true);
}

TEST_F(EvalStateTest, evalString)
{
    auto v = eval("\"hello\"");
    state.force(v);
    ASSERT_EQ(state.getType(v), ValueType::String);
    ASSERT_EQ(state.requireString(v), "hello");
}

TEST_F(EvalStateTest, evalUnicodeString)
{
    auto v = eval("\"grüße, 世界\"");
    ASSERT_EQ(state.requireString(v), "grüße, 世界");
}

TEST_F(EvalStateTest, evalPath)
{
    auto v = eval("/foo");
    state.force(v);
    ASSERT_EQ(state.getType(v), ValueType::Path);
}

TEST_F(EvalStateTest, evalAttrSet)
{
    auto v = eval("{ }");
    state.force(v);
    ASSERT_EQ(state.getType(v), ValueType::AttrSet);
}

TEST_F(EvalStateTest, evalList)
{
    auto v = eval("[ ]");
    state.force(v);
    ASSERT_EQ(state.getType(v), ValueType::List);
}

TEST_F(EvalStateTest, evalOtherTypes)
{
    ASSERT_EQ(state.getType(eval("1.5")), ValueType::Float);
    ASSERT_EQ(state.getType(eval("null")), ValueType::Null);
    ASSERT_EQ(state.getType(eval("x: x")), ValueType::Function);
    ASSERT_EQ(state.getType(eval("builtins.add 1")), ValueType::Function);
}

/* ----------------------------------------------------------------------------
 * requireString, requireInt, requireBool
 * --------------------------------------------------------------------------*/

TEST_F(EvalStateTest, requireStringOnBool)
{
    auto v = eval("true");
    state.force(v);
    try {
        state.requireString(v);
        FAIL() << "expected a WrongKindError";
    } catch (WrongKindError & e) {
        ASSERT_EQ(e.msg(), "expected a string, but got a Bool");
        ASSERT_EQ(e.expected(), ValueType::String);
        ASSERT_EQ(e.actual(), ValueType::Bool);
    }
}

TEST_F(EvalStateTest, requireStringOnPath)
{
    auto v = eval("/foo");
    state.force(v);
    try {
        state.requireString(v);
        FAIL() << "expected a WrongKindError";
    } catch (WrongKindError & e) {
        ASSERT_EQ(e.msg(), "expected a string, but got a Path");
    }
}

TEST_F(EvalStateTest, requireStringOnOtherTypes)
{
    for (auto & [expr, name] : std::vector<std::pair<std::string, std::string>>{
             {"1", "Integer"},
             {"{ }", "AttrSet"},
             {"[ ]", "List"},
             {"null", "Null"},
         }) {
        auto v = eval(expr);
        try {
            state.requireString(v);
            FAIL() << "expected a WrongKindError for " << expr;
        } catch (ExtractionError & e) {
            ASSERT_EQ(e.msg(), "expected a string, but got a " + name);
        }
    }
}

TEST_F(EvalStateTest, requireStringInvalidUTF8)
{
    auto v = eval("builtins.substring 0 1 \"ü\"");
    state.force(v);
    ASSERT_EQ(state.getType(v), ValueType::String);
    try {
        state.requireString(v);
        FAIL() << "expected an InvalidEncodingError";
    } catch (InvalidEncodingError & e) {
        ASSERT_THAT(e.msg(), HasSubstr("Nix string is not valid UTF-8"));
        ASSERT_THAT(e.msg(), HasSubstr("offset 0"));
    }
}

TEST_F(EvalStateTest, requireStringInvalidUTF8IsExtractionError)
{
    auto v = eval("builtins.substring 0 2 \"aü\"");
    ASSERT_THROW(state.requireString(v), ExtractionError);
}

TEST_F(EvalStateTest, requireStringWithContext)
{
    auto v = eval(R"(
        (derivation {
            name = "letsbuild";
            system = builtins.currentSystem;
            builder = "/bin/sh";
            args = [ "-c" "echo foo > $out" ];
        }).outPath
    )");
    state.force(v);
    ASSERT_EQ(state.getType(v), ValueType::String);
    ASSERT_THAT(state.requireString(v), StartsWith(nixStoreDir + "/"));
}

TEST_F(EvalStateTest, requireIntOnString)
{
    auto v = eval("\"1\"");
    try {
        state.requireInt(v);
        FAIL() << "expected a WrongKindError";
    } catch (WrongKindError & e) {
        ASSERT_EQ(e.msg(), "expected a integer, but got a String");
    }
}

TEST_F(EvalStateTest, requireIntLarge)
{
    ASSERT_EQ(state.requireInt(eval("9223372036854775807")), 9223372036854775807LL);
    ASSERT_EQ(state.requireInt(eval("-3")), -3);
}

TEST_F(EvalStateTest, requireBoolOnInteger)
{
    auto v = eval("0");
    ASSERT_THROW(state.requireBool(v), WrongKindError);
    ASSERT_EQ(state.requireBool(eval("1 == 2")), false);
}

/* ----------------------------------------------------------------------------
 * Errors
 * --------------------------------------------------------------------------*/

TEST_F(EvalStateTest, syntaxError)
{
    try {
        eval("1 +");
        FAIL() << "expected an EngineError";
    } catch (EngineError & e) {
        ASSERT_EQ(e.code(), NIX_ERR_NIX_ERROR);
        ASSERT_TRUE(e.name().has_value());
        ASSERT_THAT(*e.name(), HasSubstr("ParseError"));
    }
}

TEST_F(EvalStateTest, evaluationError)
{
    try {
        eval("throw \"it broke\"");
        FAIL() << "expected an EngineError";
    } catch (EngineError & e) {
        ASSERT_EQ(e.code(), NIX_ERR_NIX_ERROR);
        ASSERT_THAT(e.msg(), HasSubstr("it broke"));
        ASSERT_TRUE(e.infoMsg().has_value());
        ASSERT_THAT(*e.infoMsg(), HasSubstr("it broke"));
    }
}

TEST_F(EvalStateTest, stateIsUsableAfterError)
{
    ASSERT_THROW(eval("1 +"), EngineError);
    ASSERT_THROW(eval("builtins.abort \"no\""), EngineError);

    auto v = eval("2");
    ASSERT_EQ(state.requireInt(v), 2);
}

TEST_F(EvalStateTest, nulInExpression)
{
    ASSERT_THROW(state.evalFromString(std::string("1\0", 2), "<test>"), UsageError);
    ASSERT_THROW(state.evalFromString("1", std::string("<te\0st>", 7)), UsageError);
}

/**
 * `s` as a Nix string literal.
 */
static std::string quoteString(const std::string & s)
{
    std::string res = "\"";
    for (char c : s) {
        switch (c) {
        case '"':
        case '\\':
        case '$':
            res += '\\';
            res += c;
            break;
        case '\n':
            res += "\\n";
            break;
        case '\r':
            res += "\\r";
            break;
        case '\t':
            res += "\\t";
            break;
        default:
            res += c;
        }
    }
    return res + "\"";
}

TEST_F(EvalStateTest, requireStringOfEscapes)
{
    auto v = eval(quoteString("a\"b\\c${d}\r\n\t"));
    ASSERT_EQ(state.requireString(v), "a\"b\\c${d}\r\n\t");
}

RC_GTEST_FIXTURE_PROP(EvalStateTest, requireStringIsByteExact, (const std::vector<uint32_t> & raw))
{
    /* The C API takes NUL-terminated strings, so start above U+0000. */
    auto expected = encodeScalarValues(raw, 1);

    auto v = eval(quoteString(expected));

    RC_ASSERT(state.requireString(v) == expected);
}

/* ----------------------------------------------------------------------------
 * Construction
 * --------------------------------------------------------------------------*/

TEST_F(EvalStateTest, getStore)
{
    ASSERT_EQ(state.getStore().getStoreDir(), nixStoreDir);
}

TEST_F(EvalStateTest, explicitLookupPath)
{
    auto nixpkgs = nixDir + "/pkgs";
    std::filesystem::create_directories(nixpkgs);

    EvalState withPath(state.getStore(), Strings{"nixpkgs=" + nixpkgs});

    auto v = withPath.evalFromString("<nixpkgs>", "<test>");
    ASSERT_EQ(withPath.getType(v), ValueType::Path);
}

TEST_F(EvalStateTest, lookupPathFromSettings)
{
    auto cfg = nixDir + "/cfg";
    std::filesystem::create_directories(cfg);

    auto old = evalSettings.lookupPath.get();
    evalSettings.lookupPath = Strings{"nixos-config=" + cfg};
    EvalState fromSettings(state.getStore());
    evalSettings.lookupPath = old;

    auto v = fromSettings.evalFromString("<nixos-config>", "<test>");
    ASSERT_EQ(fromSettings.getType(v), ValueType::Path);
}

TEST_F(EvalStateTest, nulInLookupPathEntry)
{
    ASSERT_THROW(EvalState(state.getStore(), Strings{std::string("a=/x\0y", 6)}), UsageError);
}

TEST_F(EvalStateTest, missingLookupPathEntry)
{
    ASSERT_THROW(eval("<nixbind-not-on-the-lookup-path>"), EngineError);
}

TEST_F(EvalStateTest, movedState)
{
    EvalState moved(std::move(state));
    auto v = moved.evalFromString("\"moved\"", "<test>");
    ASSERT_EQ(moved.requireString(v), "moved");
}

TEST(ValueType, showType)
{
    ASSERT_EQ(showType(ValueType::Integer), "Integer");
    ASSERT_EQ(showType(ValueType::AttrSet), "AttrSet");
    ASSERT_EQ(showType(ValueType::Unknown), "Unknown");

    std::ostringstream out;
    out << ValueType::List;
    ASSERT_EQ(out.str(), "List");
}

} // namespace nixbind
