#include <gtest/gtest.h>
#include "ligaproxy/shutdown.hpp"
#include <atomic>

using namespace ligaproxy;
using namespace std::chrono;

namespace {

bool wait_for(const std::atomic<int>& counter, int expected) {
    auto deadline = steady_clock::now() + seconds(5);
    while (counter.load() != expected) {
        if (steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(milliseconds(1));
    }
    return true;
}

} // namespace

TEST(ShutdownWatcher, RunsCallbackOnceFlagIsSet) {
    std::atomic<bool> flag{false};
    std::atomic<int> calls{0};
    ShutdownWatcher watcher(flag, [&] { ++calls; }, milliseconds(5));

    std::this_thread::sleep_for(milliseconds(20));
    EXPECT_EQ(calls.load(), 0);

    flag = true;
    ASSERT_TRUE(wait_for(calls, 1));
    std::this_thread::sleep_for(milliseconds(20));
    EXPECT_EQ(calls.load(), 1);
}

TEST(ShutdownWatcher, DestroyedWithoutSignalNeverRuns) {
    std::atomic<bool> flag{false};
    std::atomic<int> calls{0};
    {
        ShutdownWatcher watcher(flag, [&] { ++calls; }, seconds(10));
    }
    EXPECT_EQ(calls.load(), 0);
}
