#include <gtest/gtest.h>

#include "nixbind/util/logging.hh"
#include "nixbind/util/tests/capture-logger.hh"

namespace nixbind {

class LoggingTest : public ::testing::Test
{
    Verbosity oldVerbosity = verbosity;

protected:
    ~LoggingTest() override
    {
        verbosity = oldVerbosity;
    }
};

TEST_F(LoggingTest, messagesAboveVerbosityAreDropped)
{
    CaptureLogging capture;
    verbosity = lvlInfo;

    printMsg(lvlInfo, "shown %d", 1);
    debug("hidden %d", 2);
    printError("shown %d", 3);

    ASSERT_EQ(capture.get(), "shown 1\nshown 3\n");
}

TEST_F(LoggingTest, debugShownAtDebugLevel)
{
    CaptureLogging capture;
    verbosity = lvlDebug;

    debug("opened store '%s'", "dummy://");

    ASSERT_EQ(capture.get(), "opened store 'dummy://'\n");
}

TEST_F(LoggingTest, argumentsAreNotEvaluatedWhenDropped)
{
    CaptureLogging capture;
    verbosity = lvlError;

    int evaluated = 0;
    auto count = [&]() { return ++evaluated; };
    debug("%d", count());

    ASSERT_EQ(evaluated, 0);
    ASSERT_EQ(capture.get(), "");
}

TEST_F(LoggingTest, warnPrefix)
{
    CaptureLogging capture;
    verbosity = lvlInfo;

    warn("unknown setting '%s'", "foo");

    ASSERT_EQ(capture.get(), "warning: unknown setting 'foo'\n");
}

TEST_F(LoggingTest, warnDroppedBelowWarnLevel)
{
    CaptureLogging capture;
    verbosity = lvlError;

    warn("unknown setting '%s'", "foo");

    ASSERT_EQ(capture.get(), "");
}

TEST_F(LoggingTest, capturedLoggerIsRestored)
{
    auto * before = logger.get();
    {
        CaptureLogging capture;
        ASSERT_NE(logger.get(), before);
    }
    ASSERT_EQ(logger.get(), before);
}

} // namespace nixbind
