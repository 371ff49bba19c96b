/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEMPERATURE_SYSTEM_HPP
#define TEMPERATURE_SYSTEM_HPP

#include "config/SimulationConfig.hpp"
#include "world/TileTypes.hpp"
#include <cstddef>
#include <cstdint>

namespace CityScale {

class TileStore;
class ZoneClassifier;

/**
 * @brief Relaxes tile temperatures in chunks near the point of interest
 *
 * Chunks out of range are left alone. When one comes back into range after
 * missing ticks it is caught up with a single fast-forward, so a cold chunk
 * costs nothing while it is cold.
 */
class TemperatureSystem {
public:
    explicit TemperatureSystem(const TemperatureConfig& config);

    // Returns the number of chunks whose temperatures were recomputed
    size_t update(TileStore& tiles, const ZoneClassifier& classifier, TilePos poi, uint64_t tick) const;

private:
    TemperatureConfig m_config;
};

} // namespace CityScale

#endif // TEMPERATURE_SYSTEM_HPP
