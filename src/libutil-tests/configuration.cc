#include <gtest/gtest.h>

#include "nixbind/util/configuration.hh"
#include "nixbind/util/error.hh"
#include "nixbind/util/logging.hh"
#include "nixbind/util/tests/capture-logger.hh"

namespace nixbind {

/* ----------------------------------------------------------------------------
 * Config
 * --------------------------------------------------------------------------*/

TEST(Config, setUndefinedSetting)
{
    Config config;
    ASSERT_FALSE(config.set("undefined-key", "value"));
}

TEST(Config, setDefinedSetting)
{
    Config config;
    Setting<std::string> foo{&config, "default", "name-of-the-setting", "description"};
    ASSERT_FALSE(foo.isOverridden());

    ASSERT_TRUE(config.set("name-of-the-setting", "value"));
    ASSERT_EQ(foo.get(), "value");
    ASSERT_TRUE(foo.isOverridden());
}

TEST(Config, assignmentIsNotAnOverride)
{
    Config config;
    Setting<std::string> foo{&config, "default", "foo", ""};

    foo = "from code";
    ASSERT_EQ(foo.get(), "from code");
    ASSERT_FALSE(foo.isOverridden());
}

TEST(Config, aliases)
{
    Config config;
    Setting<Strings> setting{&config, {}, "lookup-path", "", {"nix-path"}};

    ASSERT_TRUE(config.set("nix-path", "a=/x b=/y"));
    ASSERT_EQ(setting.get(), (Strings{"a=/x", "b=/y"}));
    ASSERT_TRUE(setting.isOverridden());
}

TEST(Config, appendToStrings)
{
    Config config;
    Setting<Strings> paths{&config, {"a"}, "paths", ""};

    ASSERT_TRUE(config.set("extra-paths", "b  c"));
    ASSERT_EQ(paths.get(), (Strings{"a", "b", "c"}));
    ASSERT_EQ(paths.toString(), "a b c");

    ASSERT_TRUE(config.set("paths", "d"));
    ASSERT_EQ(paths.get(), (Strings{"d"}));
}

TEST(Config, appendThroughAlias)
{
    Config config;
    Setting<Strings> paths{&config, {"a"}, "lookup-path", "", {"nix-path"}};

    ASSERT_TRUE(config.set("extra-nix-path", "b"));
    ASSERT_EQ(paths.get(), (Strings{"a", "b"}));
}

TEST(Config, cannotAppendToScalars)
{
    Config config;
    Setting<std::string> foo{&config, "", "foo", ""};
    ASSERT_FALSE(config.set("extra-foo", "bar"));
    ASSERT_FALSE(foo.isOverridden());
}

TEST(Config, setLogsNewValueAtDebugLevel)
{
    auto oldVerbosity = verbosity;
    verbosity = lvlDebug;
    {
        CaptureLogging capture;
        Config config;
        Setting<std::string> foo{&config, "", "foo", ""};

        config.set("foo", "bar");

        ASSERT_EQ(capture.get(), "setting 'foo' is now 'bar'\n");
    }
    verbosity = oldVerbosity;
}

/* ----------------------------------------------------------------------------
 * parseConfig
 * --------------------------------------------------------------------------*/

TEST(parseConfig, assignmentsAndComments)
{
    auto assignments = parseConfig(
        "# a comment\n"
        "foo = hello   world # trailing comment\n"
        "\n"
        "   \t\n"
        "bar = x\n"
        "extra-bar = y\n",
        "test.conf");

    using A = std::pair<std::string, std::string>;
    ASSERT_EQ(
        assignments,
        (std::vector<A>{
            A{"foo", "hello world"},
            A{"bar", "x"},
            A{"extra-bar", "y"},
        }));
}

TEST(parseConfig, emptyValue)
{
    auto assignments = parseConfig("foo =\n", "test.conf");
    ASSERT_EQ(assignments.size(), 1u);
    ASSERT_EQ(assignments[0].second, "");
}

TEST(parseConfig, syntaxError)
{
    try {
        parseConfig("foo bar", "test.conf");
        FAIL() << "expected a UsageError";
    } catch (UsageError & e) {
        ASSERT_EQ(e.msg(), "syntax error in configuration line 'foo bar' in 'test.conf'");
    }
}

TEST(parseConfig, nameWithoutValue)
{
    ASSERT_THROW(parseConfig("foo\n", "test.conf"), UsageError);
}

} // namespace nixbind
