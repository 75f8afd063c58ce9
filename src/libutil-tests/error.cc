#include <gtest/gtest.h>

#include "nixbind/util/error.hh"

namespace nixbind {

MakeError(TestError, Error);

TEST(BaseError, formatsMessage)
{
    Error e("cannot open '%s': %d", "foo", 42);
    ASSERT_EQ(e.msg(), "cannot open 'foo': 42");
    ASSERT_STREQ(e.what(), "cannot open 'foo': 42");
}

TEST(BaseError, singleArgumentIsLiteral)
{
    Error e("100% literal %s");
    ASSERT_EQ(e.msg(), "100% literal %s");
}

TEST(BaseError, subclassesAreCaughtAsError)
{
    try {
        throw TestError("subclass %s", "thrown");
    } catch (Error & e) {
        ASSERT_EQ(e.msg(), "subclass thrown");
        return;
    }
    FAIL() << "TestError was not caught as Error";
}

TEST(BaseError, usageAndInitErrorsAreDistinct)
{
    ASSERT_THROW(throw UsageError("bad"), UsageError);
    ASSERT_THROW(throw InitError("bad"), InitError);
    ASSERT_THROW(throw InitError("bad"), Error);
}

TEST(BaseError, errorsAreStdExceptions)
{
    try {
        throw UsageError("bad value '%s'", "x");
    } catch (std::exception & e) {
        ASSERT_STREQ(e.what(), "bad value 'x'");
    }
}

/* ----------------------------------------------------------------------------
 * fmt
 * --------------------------------------------------------------------------*/

TEST(fmt, positionalArguments)
{
    ASSERT_EQ(fmt("%2% before %1%", "a", "b"), "b before a");
}

TEST(fmt, tooFewArgumentsAreNotFatal)
{
    ASSERT_EQ(fmt("%s and %s", "one"), "one and ");
}

TEST(fmt, tooManyArgumentsAreNotFatal)
{
    ASSERT_EQ(fmt("%s", "one", "two"), "one");
}

TEST(fmt, noArgumentsIsLiteral)
{
    ASSERT_EQ(fmt("50%"), "50%");
}

TEST(fmt, badFormatThrows)
{
    ASSERT_THROW(fmt("%", 1), boost::io::bad_format_string);
}

} // namespace nixbind
