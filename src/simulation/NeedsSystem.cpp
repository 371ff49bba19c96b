/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/NeedsSystem.hpp"
#include "population/IndividualTable.hpp"
#include <algorithm>

namespace CityScale {

NeedsSystem::NeedsSystem(const NeedsConfig& config)
    : m_config(config) {}

void NeedsSystem::drift(Needs& needs, uint32_t ticks) const {
    const float n = static_cast<float>(ticks);
    needs.hunger = std::min(m_config.maxNeed, needs.hunger + m_config.hungerPerTick * n);
    needs.fatigue = std::min(m_config.maxNeed, needs.fatigue + m_config.fatiguePerTick * n);
}

size_t NeedsSystem::update(IndividualTable& individuals, uint64_t tick) const {
    const uint32_t cadence = static_cast<uint32_t>(m_config.nearbyCadenceTicks);
    const bool cadenceTick = tick % cadence == 0;

    size_t updated = 0;
    for (Individual& record : individuals.records()) {
        if (record.zone == Zone::Active && record.transition != Transition::Buffering) {
            drift(record.needs, 1);
            ++updated;
        } else if (cadenceTick) {
            drift(record.needs, cadence);
            ++updated;
        }
    }
    return updated;
}

} // namespace CityScale
