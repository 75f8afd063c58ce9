#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "nixbind/store/globals.hh"
#include "nixbind/store/store.hh"
#include "nixbind/store/tests/store.hh"
#include "nixbind/util/error-channel.hh"

#include <optional>

namespace nixbind {

using testing::HasSubstr;
using testing::StartsWith;

TEST(Store, initIsIdempotent)
{
    ASSERT_NO_THROW(ensureLibStoreInitialized());
    ASSERT_NO_THROW(ensureLibStoreInitialized());
}

TEST(Store, openDummy)
{
    auto store = Store::open("dummy://");
    ASSERT_NE(store.raw(), nullptr);
    ASSERT_THAT(store.getUri(), StartsWith("dummy"));
    ASSERT_EQ(store.getStoreDir(), "/nix/store");
}

TEST(Store, dummyReportsNoVersion)
{
    auto store = Store::open("dummy://");
    ASSERT_EQ(store.getVersion(), "");
}

TEST(Store, openUnknownScheme)
{
    try {
        Store::open("nixbind-bogus://");
        FAIL() << "expected an EngineError";
    } catch (EngineError & e) {
        ASSERT_EQ(e.code(), NIX_ERR_NIX_ERROR);
        ASSERT_THAT(e.msg(), HasSubstr("nixbind-bogus"));
    }
}

TEST(Store, openDefaultUsesSetting)
{
    auto old = storeSettings.storeUri.get();
    storeSettings.storeUri = "dummy://";

    auto store = Store::openDefault();
    ASSERT_THAT(store.getUri(), StartsWith("dummy"));

    storeSettings.storeUri = old;
}

TEST(Store, defaultStoreSetting)
{
    ASSERT_EQ(storeSettings.storeUri.toString(), "auto");
}

TEST(Store, copiesShareTheBackend)
{
    auto store = Store::open("dummy://");
    auto copy = store;

    ASSERT_EQ(store, copy);
    ASSERT_EQ(store.raw(), copy.raw());

    auto other = Store::open("dummy://");
    ASSERT_FALSE(store == other);
}

TEST(Store, copyOutlivesOriginal)
{
    std::optional<Store> copy;
    {
        auto store = Store::open("dummy://");
        copy = store;
    }
    ASSERT_EQ(copy->getStoreDir(), "/nix/store");
}

class LocalStoreTestStore : public LocalStoreTest
{};

TEST_F(LocalStoreTestStore, getStoreDir)
{
    auto store = openLocalStore();
    ASSERT_EQ(store.getStoreDir(), nixStoreDir);
}

TEST_F(LocalStoreTestStore, getUri)
{
    auto store = openLocalStore();
    ASSERT_THAT(store.getUri(), StartsWith("local"));
}

TEST_F(LocalStoreTestStore, getVersion)
{
    auto store = openLocalStore();
    ASSERT_FALSE(store.getVersion().empty());
}

TEST_F(LocalStoreTestStore, reopen)
{
    auto first = openLocalStore();
    auto second = openLocalStore();
    ASSERT_EQ(first.getStoreDir(), second.getStoreDir());
}

} // namespace nixbind
