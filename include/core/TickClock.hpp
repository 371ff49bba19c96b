/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TICK_CLOCK_HPP
#define TICK_CLOCK_HPP

#include "config/SimulationConfig.hpp"
#include <chrono>
#include <cstdint>

namespace CityScale {

/**
 * TickClock paces the simulation loop at a fixed tick rate and measures how
 * long each tick's work took against the per-tick budget.
 *
 * Usage per tick: beginTick(), run the pipeline, endTick(). endTick() sleeps
 * out the remainder of the tick period with SDL's precise delay.
 */
class TickClock {
public:
    explicit TickClock(const TickConfig& config);

    void beginTick();

    /**
     * Records the elapsed work time and, when pace is true, waits until the
     * tick period has passed.
     * @return work time of this tick in milliseconds
     */
    double endTick(bool pace = true);

    double getLastTickMs() const { return m_lastTickMs; }
    double getAverageTickMs() const { return m_averageTickMs; }
    double getTargetTickMs() const { return m_targetTickMs; }
    double getBudgetMs() const { return m_budgetMs; }
    uint64_t getTicksMeasured() const { return m_ticksMeasured; }
    uint64_t getOverrunCount() const { return m_overruns; }

    bool isOverBudget() const { return m_lastTickMs > m_budgetMs; }

    void reset();

private:
    double m_targetTickMs;
    double m_budgetMs;

    std::chrono::high_resolution_clock::time_point m_tickStart;

    double m_lastTickMs{0.0};
    double m_averageTickMs{0.0};   // EMA smoothed
    double m_smoothingAlpha{0.05};
    uint64_t m_ticksMeasured{0};
    uint64_t m_overruns{0};

    void waitForPeriodEnd() const;
};

} // namespace CityScale

#endif // TICK_CLOCK_HPP
