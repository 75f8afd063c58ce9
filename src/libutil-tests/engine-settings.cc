#include <gtest/gtest.h>

#include "nixbind/util/engine-settings.hh"
#include "nixbind/util/error.hh"

namespace nixbind {

class EngineSettingsTest : public ::testing::Test
{
protected:
    static void SetUpTestSuite()
    {
        ensureLibUtilInitialized();
    }
};

TEST_F(EngineSettingsTest, engineVersion)
{
    ASSERT_FALSE(engineVersion().empty());
}

TEST_F(EngineSettingsTest, getUnknownSetting)
{
    ASSERT_EQ(getEngineSetting("nixbind-no-such-setting"), std::nullopt);
}

TEST_F(EngineSettingsTest, setUnknownSetting)
{
    try {
        setEngineSetting("nixbind-no-such-setting", "x");
        FAIL() << "expected a UsageError";
    } catch (UsageError & e) {
        ASSERT_EQ(e.msg(), "unknown engine setting 'nixbind-no-such-setting'");
    }
}

TEST_F(EngineSettingsTest, setThenGet)
{
    auto old = getEngineSetting("experimental-features");
    ASSERT_TRUE(old.has_value());

    setEngineSetting("experimental-features", "recursive-nix");
    ASSERT_EQ(getEngineSetting("experimental-features"), "recursive-nix");

    setEngineSetting("experimental-features", *old);
}

TEST_F(EngineSettingsTest, unknownSettingLeavesNoPendingError)
{
    ASSERT_EQ(getEngineSetting("nixbind-no-such-setting"), std::nullopt);
    ASSERT_NO_THROW(engineVersion());
    ASSERT_TRUE(getEngineSetting("experimental-features").has_value());
}

TEST_F(EngineSettingsTest, setEngineVerbosity)
{
    ASSERT_NO_THROW(setEngineVerbosity(lvlError));
    ASSERT_NO_THROW(setEngineVerbosity(lvlInfo));
}

} // namespace nixbind
