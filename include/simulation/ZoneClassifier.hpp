/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ZONE_CLASSIFIER_HPP
#define ZONE_CLASSIFIER_HPP

#include "config/SimulationConfig.hpp"
#include "population/Individual.hpp"
#include "world/TileTypes.hpp"
#include <cstddef>
#include <cstdint>

namespace CityScale {

class DistrictRegistry;
class IndividualTable;
class TileStore;

struct ZoneCounts {
    size_t active{0};
    size_t nearby{0};
    size_t statistical{0};
};

/**
 * @brief Distance-only fidelity tagging around the point of interest
 *
 * d <= activeRadius is Active, d <= nearbyRadius is Nearby, anything
 * farther is Statistical. No state is carried between ticks.
 */
class ZoneClassifier {
public:
    explicit ZoneClassifier(const ZoneConfig& config);

    Zone classify(TilePos poi, TilePos pos) const;
    Zone classifyDistrict(TilePos poi, TilePos centroid) const { return classify(poi, centroid); }
    Zone classifyChunk(const TileStore& tiles, TilePos poi, int32_t cx, int32_t cy) const;

    // Retags every record and every district; returns the record tallies
    ZoneCounts update(TilePos poi, IndividualTable& individuals, DistrictRegistry& districts) const;

    const ZoneConfig& config() const { return m_config; }

private:
    ZoneConfig m_config;
    double m_activeSq;
    double m_nearbySq;
};

} // namespace CityScale

#endif // ZONE_CLASSIFIER_HPP
