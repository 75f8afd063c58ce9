#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdlib>

#include "nixbind/util/config-global.hh"
#include "nixbind/util/error.hh"
#include "nixbind/util/logging.hh"
#include "nixbind/util/tests/capture-logger.hh"

namespace nixbind {

struct TestSettings : Config
{
    Setting<std::string> greeting{this, "hello", "test-greeting", "A greeting."};
    Setting<Strings> names{this, {}, "test-names", "Some names."};
};

static TestSettings testSettings;
static GlobalConfig::Register rTestSettings(&testSettings);

class GlobalConfigTest : public ::testing::Test
{
    Verbosity oldVerbosity = verbosity;

protected:
    ~GlobalConfigTest() override
    {
        unsetenv("NIXBIND_CONFIG");
        testSettings.greeting = "hello";
        testSettings.names = Strings{};
        verbosity = oldVerbosity;
    }
};

TEST_F(GlobalConfigTest, setRegisteredSetting)
{
    ASSERT_TRUE(globalConfig.set("test-greeting", "hi"));
    ASSERT_EQ(testSettings.greeting.get(), "hi");
}

TEST_F(GlobalConfigTest, setUnknownSetting)
{
    ASSERT_FALSE(globalConfig.set("test-no-such-setting", "x"));
}

TEST_F(GlobalConfigTest, applyConfigReturnsUnknownNames)
{
    auto unknown = globalConfig.applyConfig(
        "test-what = 1\n"
        "test-greeting = hi\n"
        "extra-test-greeting = no\n",
        "test.conf");

    ASSERT_EQ(unknown, (Strings{"test-what", "extra-test-greeting"}));
    ASSERT_EQ(testSettings.greeting.get(), "hi");
}

TEST_F(GlobalConfigTest, applyConfigIsAllOrNothing)
{
    ASSERT_THROW(globalConfig.applyConfig("test-greeting = hi\nbroken\n", "test.conf"), UsageError);
    ASSERT_EQ(testSettings.greeting.get(), "hello");
}

TEST_F(GlobalConfigTest, loadConfFromEnv)
{
    setenv("NIXBIND_CONFIG", "test-greeting = hi there\nextra-test-names = a b\n", 1);

    loadConfFromEnv();

    ASSERT_EQ(testSettings.greeting.get(), "hi there");
    ASSERT_EQ(testSettings.names.get(), (Strings{"a", "b"}));
}

TEST_F(GlobalConfigTest, loadConfFromEnvWarnsAboutUnknownSettings)
{
    CaptureLogging capture;
    verbosity = lvlInfo;
    setenv("NIXBIND_CONFIG", "test-what-is-this = 1\n", 1);

    loadConfFromEnv();

    ASSERT_THAT(capture.get(), testing::HasSubstr("warning: unknown setting 'test-what-is-this'"));
}

TEST_F(GlobalConfigTest, loadConfFromEnvSyntaxError)
{
    setenv("NIXBIND_CONFIG", "test-greeting\n", 1);

    ASSERT_THROW(loadConfFromEnv(), UsageError);
}

TEST_F(GlobalConfigTest, loadConfFromEnvUnset)
{
    unsetenv("NIXBIND_CONFIG");

    loadConfFromEnv();

    ASSERT_EQ(testSettings.greeting.get(), "hello");
}

} // namespace nixbind
