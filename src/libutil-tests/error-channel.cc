#include <gtest/gtest.h>

#include "nixbind/util/error-channel.hh"

namespace nixbind {

TEST(ErrorChannel, emptyChannelDoesNotThrow)
{
    ErrorChannel channel;
    ASSERT_FALSE(channel.hasError());
    ASSERT_NO_THROW(channel.check());
}

TEST(ErrorChannel, checkTranslatesError)
{
    ErrorChannel channel;
    nix_set_err_msg(channel.ptr(), NIX_ERR_UNKNOWN, "unknown test error");
    ASSERT_TRUE(channel.hasError());

    try {
        channel.check();
        FAIL() << "expected an EngineError";
    } catch (EngineError & e) {
        ASSERT_EQ(e.code(), NIX_ERR_UNKNOWN);
        ASSERT_EQ(e.msg(), "unknown test error");
        ASSERT_EQ(e.name(), std::nullopt);
        ASSERT_EQ(e.infoMsg(), std::nullopt);
    }
}

TEST(ErrorChannel, checkConsumesError)
{
    ErrorChannel channel;
    nix_set_err_msg(channel.ptr(), NIX_ERR_KEY, "no such key");

    ASSERT_THROW(channel.check(), EngineError);
    ASSERT_FALSE(channel.hasError());
    ASSERT_NO_THROW(channel.check());
}

TEST(ErrorChannel, clearDiscardsError)
{
    ErrorChannel channel;
    nix_set_err_msg(channel.ptr(), NIX_ERR_OVERFLOW, "too big");

    channel.clear();

    ASSERT_FALSE(channel.hasError());
    ASSERT_NO_THROW(channel.check());
}

TEST(ErrorChannel, channelIsReusableAfterError)
{
    ErrorChannel channel;
    nix_set_err_msg(channel.ptr(), NIX_ERR_UNKNOWN, "first");
    ASSERT_THROW(channel.check(), EngineError);

    nix_set_err_msg(channel.ptr(), NIX_ERR_UNKNOWN, "second");
    try {
        channel.check();
        FAIL() << "expected an EngineError";
    } catch (EngineError & e) {
        ASSERT_EQ(e.msg(), "second");
    }
}

TEST(ErrorChannel, movedChannelKeepsContext)
{
    ErrorChannel channel;
    auto * ctx = channel.ptr();

    ErrorChannel other(std::move(channel));

    ASSERT_EQ(other.ptr(), ctx);
    ASSERT_EQ(channel.ptr(), nullptr);
}

} // namespace nixbind
