/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TickClock.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <string>

namespace CityScale {

TickClock::TickClock(const TickConfig& config)
    : m_targetTickMs(1000.0 / static_cast<double>(config.tickRateHz))
    , m_budgetMs(static_cast<double>(config.budgetMs))
    , m_tickStart(std::chrono::high_resolution_clock::now())
{
}

void TickClock::beginTick() {
    m_tickStart = std::chrono::high_resolution_clock::now();
}

double TickClock::endTick(bool pace) {
    auto now = std::chrono::high_resolution_clock::now();
    auto workNs = std::chrono::duration_cast<std::chrono::nanoseconds>(now - m_tickStart);
    m_lastTickMs = static_cast<double>(workNs.count()) / 1000000.0;

    if (m_ticksMeasured == 0) {
        m_averageTickMs = m_lastTickMs;
    } else {
        m_averageTickMs = m_smoothingAlpha * m_lastTickMs + (1.0 - m_smoothingAlpha) * m_averageTickMs;
    }
    ++m_ticksMeasured;

    if (m_lastTickMs > m_budgetMs) {
        ++m_overruns;
        TICKCLOCK_WARN("Tick " + std::to_string(m_ticksMeasured) + " took " +
                       std::to_string(m_lastTickMs) + " ms, budget " +
                       std::to_string(m_budgetMs) + " ms");
    }

    if (pace) {
        waitForPeriodEnd();
    }
    return m_lastTickMs;
}

void TickClock::reset() {
    m_lastTickMs = 0.0;
    m_averageTickMs = 0.0;
    m_ticksMeasured = 0;
    m_overruns = 0;
    m_tickStart = std::chrono::high_resolution_clock::now();
}

void TickClock::waitForPeriodEnd() const {
    // Absolute end of this tick period, measured from beginTick()
    int64_t periodNs = static_cast<int64_t>(m_targetTickMs * 1e6);
    auto targetEndTime = m_tickStart + std::chrono::nanoseconds(periodNs);

    auto now = std::chrono::high_resolution_clock::now();
    auto remainingNs = std::chrono::duration_cast<std::chrono::nanoseconds>(targetEndTime - now);

    if (remainingNs.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remainingNs.count()));
    }
}

} // namespace CityScale
