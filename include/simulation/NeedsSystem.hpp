/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef NEEDS_SYSTEM_HPP
#define NEEDS_SYSTEM_HPP

#include "config/SimulationConfig.hpp"
#include "population/Individual.hpp"
#include <cstddef>
#include <cstdint>

namespace CityScale {

class IndividualTable;

// Per-record hunger and fatigue drift. Active records every tick, everything
// else at the reduced Nearby cadence with the missed ticks folded in.
class NeedsSystem {
public:
    explicit NeedsSystem(const NeedsConfig& config);

    size_t update(IndividualTable& individuals, uint64_t tick) const;

    void drift(Needs& needs, uint32_t ticks) const;

private:
    NeedsConfig m_config;
};

} // namespace CityScale

#endif // NEEDS_SYSTEM_HPP
