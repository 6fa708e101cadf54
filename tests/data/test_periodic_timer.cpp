#include "sdrbridge/data/periodic_timer.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <atomic>

using namespace sdrbridge::data;
using sdrbridge::test_support::wait_for;
using namespace std::chrono_literals;

TEST(PeriodicTimer, TicksRepeatedly) {
    std::atomic<int> ticks{0};
    PeriodicTimer timer;
    ASSERT_TRUE(timer.start(5ms, [&] { ticks.fetch_add(1); }));
    EXPECT_TRUE(timer.running());
    EXPECT_TRUE(wait_for([&] { return ticks.load() >= 3; }));
    timer.stop();
    EXPECT_FALSE(timer.running());
}

TEST(PeriodicTimer, NoTicksAfterStop) {
    std::atomic<int> ticks{0};
    PeriodicTimer timer;
    ASSERT_TRUE(timer.start(5ms, [&] { ticks.fetch_add(1); }));
    ASSERT_TRUE(wait_for([&] { return ticks.load() >= 1; }));
    timer.stop();
    const int after_stop = ticks.load();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(ticks.load(), after_stop);
}

TEST(PeriodicTimer, StopWakesLongInterval) {
    PeriodicTimer timer;
    ASSERT_TRUE(timer.start(std::chrono::milliseconds(60'000), [] {}));
    const auto begin = std::chrono::steady_clock::now();
    timer.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
}

TEST(PeriodicTimer, RejectsDoubleStartAndBadInterval) {
    PeriodicTimer timer;
    EXPECT_FALSE(timer.start(0ms, [] {}));
    EXPECT_FALSE(timer.start(-5ms, [] {}));
    ASSERT_TRUE(timer.start(10ms, [] {}));
    EXPECT_FALSE(timer.start(10ms, [] {}));
    timer.stop();
}

TEST(PeriodicTimer, StopIsIdempotent) {
    PeriodicTimer never_started;
    never_started.stop();
    never_started.stop();

    PeriodicTimer timer;
    ASSERT_TRUE(timer.start(10ms, [] {}));
    timer.stop();
    timer.stop();
    // Restartable after stop.
    EXPECT_TRUE(timer.start(10ms, [] {}));
}
