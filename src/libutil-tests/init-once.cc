#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

#include "nixbind/util/init-once.hh"

namespace nixbind {

TEST(InitOnce, runsRoutineOnce)
{
    int runs = 0;
    InitOnce init("test-init", [&]() { runs++; });

    ASSERT_FALSE(init.attempted());
    init.ensure();
    init.ensure();

    ASSERT_TRUE(init.attempted());
    ASSERT_EQ(runs, 1);
}

TEST(InitOnce, concurrentCallersShareOneRun)
{
    std::atomic<int> runs = 0;
    InitOnce init("test-init", [&]() {
        runs++;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    });

    std::atomic<int> succeeded = 0;
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i)
        threads.emplace_back([&]() {
            init.ensure();
            succeeded++;
        });
    for (auto & t : threads)
        t.join();

    ASSERT_EQ(runs, 1);
    ASSERT_EQ(succeeded, 16);
}

TEST(InitOnce, failureIsCachedNotRetried)
{
    int runs = 0;
    InitOnce init("test-init", [&]() {
        runs++;
        throw Error("it broke");
    });

    for (int i = 0; i < 3; ++i) {
        try {
            init.ensure();
            FAIL() << "expected an InitError";
        } catch (InitError & e) {
            ASSERT_EQ(e.msg(), "test-init error: it broke");
        }
    }

    ASSERT_TRUE(init.attempted());
    ASSERT_EQ(runs, 1);
}

TEST(InitOnce, standardExceptionsAreCaptured)
{
    InitOnce init("test-init", []() { throw std::runtime_error("out of luck"); });

    ASSERT_THROW(init.ensure(), InitError);
    try {
        init.ensure();
    } catch (InitError & e) {
        ASSERT_EQ(e.msg(), "test-init error: out of luck");
    }
}

TEST(InitOnce, concurrentCallersShareOneFailure)
{
    std::atomic<int> runs = 0;
    InitOnce init("test-init", [&]() {
        runs++;
        throw Error("it broke");
    });

    std::atomic<int> failed = 0;
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i)
        threads.emplace_back([&]() {
            try {
                init.ensure();
            } catch (InitError &) {
                failed++;
            }
        });
    for (auto & t : threads)
        t.join();

    ASSERT_EQ(runs, 1);
    ASSERT_EQ(failed, 16);
}

} // namespace nixbind
