/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TickClockTests
#include <boost/test/unit_test.hpp>

#include "core/TickClock.hpp"
#include <chrono>
#include <thread>

using namespace CityScale;

namespace {

TickConfig makeTickConfig(int rateHz, float budgetMs) {
    TickConfig config;
    config.tickRateHz = rateHz;
    config.budgetMs = budgetMs;
    return config;
}

void sleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

} // namespace

BOOST_AUTO_TEST_SUITE(TickClockTests)

BOOST_AUTO_TEST_CASE(TestTargetFromRate) {
    TickClock clock(makeTickConfig(100, 10.0f));
    BOOST_CHECK_CLOSE(clock.getTargetTickMs(), 10.0, 1e-9);
    BOOST_CHECK_CLOSE(clock.getBudgetMs(), 10.0, 1e-9);
    BOOST_CHECK_EQUAL(clock.getTicksMeasured(), 0u);
}

BOOST_AUTO_TEST_CASE(TestFirstSampleSeedsTheAverage) {
    TickClock clock(makeTickConfig(100, 1000.0f));
    clock.beginTick();
    sleepFor(std::chrono::milliseconds(2));
    const double work = clock.endTick(false);

    BOOST_CHECK_GE(work, 2.0);
    BOOST_CHECK_EQUAL(clock.getLastTickMs(), work);
    BOOST_CHECK_EQUAL(clock.getAverageTickMs(), work);
    BOOST_CHECK_EQUAL(clock.getTicksMeasured(), 1u);
    BOOST_CHECK_EQUAL(clock.getOverrunCount(), 0u);
    BOOST_CHECK(!clock.isOverBudget());
}

BOOST_AUTO_TEST_CASE(TestAverageIsSmoothed) {
    TickClock clock(makeTickConfig(100, 1000.0f));
    clock.beginTick();
    sleepFor(std::chrono::milliseconds(20));
    const double slow = clock.endTick(false);

    clock.beginTick();
    const double fast = clock.endTick(false);

    BOOST_CHECK_LT(fast, slow);
    BOOST_CHECK_CLOSE(clock.getAverageTickMs(), 0.05 * fast + 0.95 * slow, 1e-6);
}

BOOST_AUTO_TEST_CASE(TestOverrunsAreCounted) {
    TickClock clock(makeTickConfig(100, 0.5f));
    for (int i = 0; i < 3; ++i) {
        clock.beginTick();
        sleepFor(std::chrono::milliseconds(2));
        clock.endTick(false);
    }
    BOOST_CHECK_EQUAL(clock.getOverrunCount(), 3u);
    BOOST_CHECK(clock.isOverBudget());

    clock.reset();
    BOOST_CHECK_EQUAL(clock.getOverrunCount(), 0u);
    BOOST_CHECK_EQUAL(clock.getTicksMeasured(), 0u);
    BOOST_CHECK_EQUAL(clock.getAverageTickMs(), 0.0);
}

BOOST_AUTO_TEST_CASE(TestPacingFillsThePeriod) {
    TickClock clock(makeTickConfig(50, 20.0f));
    const auto start = std::chrono::steady_clock::now();
    clock.beginTick();
    clock.endTick(true);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    BOOST_CHECK_GE(elapsed.count(), 19);
    BOOST_CHECK_LT(clock.getLastTickMs(), 20.0);
}

BOOST_AUTO_TEST_SUITE_END()
