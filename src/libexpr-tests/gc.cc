#include <gtest/gtest.h>

#include <atomic>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "nixbind/expr/gc.hh"
#include "nixbind/expr/init.hh"
#include "nixbind/expr/tests/eval-state.hh"

namespace nixbind {

/**
 * Run `f` on a fresh thread, which the collector does not know about,
 * and rethrow whatever it threw.
 */
template<typename F>
static void onNewThread(F f)
{
    std::exception_ptr ex;
    std::thread t([&]() {
        try {
            f();
        } catch (...) {
            ex = std::current_exception();
        }
    });
    t.join();
    if (ex)
        std::rethrow_exception(ex);
}

TEST(ensureInitialized, concurrentCallers)
{
    std::atomic<int> ok = 0;
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i)
        threads.emplace_back([&]() {
            ensureInitialized();
            ok++;
        });
    for (auto & t : threads)
        t.join();
    ASSERT_EQ(ok, 16);
}

TEST(ThreadRegistration, mainThreadIsRegistered)
{
    ASSERT_TRUE(isThreadRegistered());

    ThreadRegistration registration;
    ASSERT_FALSE(registration.ownsRegistration());
    ASSERT_TRUE(isThreadRegistered());
}

TEST(ThreadRegistration, newThreadIsNotRegistered)
{
    onNewThread([]() { ASSERT_FALSE(isThreadRegistered()); });
}

TEST(ThreadRegistration, registersAndUnregisters)
{
    onNewThread([]() {
        {
            ThreadRegistration registration;
            ASSERT_TRUE(registration.ownsRegistration());
            ASSERT_TRUE(isThreadRegistered());
        }
        ASSERT_FALSE(isThreadRegistered());
    });
}

TEST(ThreadRegistration, nestedRegistrationDoesNotUnregister)
{
    onNewThread([]() {
        withRegisteredThread([]() {
            ASSERT_TRUE(isThreadRegistered());
            withRegisteredThread([]() {
                ThreadRegistration inner;
                ASSERT_FALSE(inner.ownsRegistration());
                ASSERT_TRUE(isThreadRegistered());
            });
            ASSERT_TRUE(isThreadRegistered());
        });
        ASSERT_FALSE(isThreadRegistered());
    });
}

TEST(withRegisteredThread, returnsResult)
{
    onNewThread([]() {
        auto res = withRegisteredThread([]() { return std::string("result"); });
        ASSERT_EQ(res, "result");
    });
}

TEST(withRegisteredThread, unregistersOnException)
{
    onNewThread([]() {
        ASSERT_THROW(withRegisteredThread([]() -> int { throw std::runtime_error("inside"); }), std::runtime_error);
        ASSERT_FALSE(isThreadRegistered());
    });
}

TEST(runCollectionNow, canBeCalledRepeatedly)
{
    ASSERT_NO_THROW(runCollectionNow());
    ASSERT_NO_THROW(runCollectionNow());
}

class GcTest : public EvalStateTest
{};

TEST_F(GcTest, copiedValueSurvivesCollection)
{
    std::optional<Value> copy;
    {
        auto v = eval("builtins.concatStringsSep \" \" [ \"hello\" \"world\" ]");
        state.force(v);
        copy = v;
    }
    runCollectionNow();
    ASSERT_EQ(state.requireString(*copy), "hello world");
}

TEST_F(GcTest, movedValueKeepsReference)
{
    auto v = eval("[ 1 2 3 ]");
    Value moved(std::move(v));
    ASSERT_EQ(v.raw(), nullptr);
    runCollectionNow();
    ASSERT_EQ(state.getType(moved), ValueType::List);
}

TEST_F(GcTest, evaluateOnRegisteredThread)
{
    onNewThread([&]() {
        withRegisteredThread([&]() {
            auto v = eval("\"from another thread\"");
            ASSERT_EQ(state.requireString(v), "from another thread");
            runCollectionNow();
        });
    });
}

TEST_F(GcTest, valuesShareAcrossThreads)
{
    auto v = eval("{ a = 1; }");
    onNewThread([&]() {
        withRegisteredThread([&]() {
            auto copy = v;
            ASSERT_EQ(state.getType(copy), ValueType::AttrSet);
        });
    });
    ASSERT_EQ(state.getType(v), ValueType::AttrSet);
}

} // namespace nixbind
