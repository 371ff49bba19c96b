/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/ZoneClassifier.hpp"
#include "population/DistrictRegistry.hpp"
#include "population/IndividualTable.hpp"
#include "world/TileStore.hpp"

namespace CityScale {

ZoneClassifier::ZoneClassifier(const ZoneConfig& config)
    : m_config(config)
    , m_activeSq(static_cast<double>(config.activeRadius) * static_cast<double>(config.activeRadius))
    , m_nearbySq(static_cast<double>(config.nearbyRadius) * static_cast<double>(config.nearbyRadius))
{
}

Zone ZoneClassifier::classify(TilePos poi, TilePos pos) const {
    // Squared distances in double are exact for any int32 tile offset
    const double dx = static_cast<double>(pos.x) - static_cast<double>(poi.x);
    const double dy = static_cast<double>(pos.y) - static_cast<double>(poi.y);
    const double distSq = dx * dx + dy * dy;
    if (distSq <= m_activeSq) {
        return Zone::Active;
    }
    if (distSq <= m_nearbySq) {
        return Zone::Nearby;
    }
    return Zone::Statistical;
}

Zone ZoneClassifier::classifyChunk(const TileStore& tiles, TilePos poi, int32_t cx, int32_t cy) const {
    return classify(poi, tiles.chunkCenter(cx, cy));
}

ZoneCounts ZoneClassifier::update(TilePos poi, IndividualTable& individuals, DistrictRegistry& districts) const {
    ZoneCounts counts;
    for (Individual& record : individuals.records()) {
        record.zone = classify(poi, record.position);
        switch (record.zone) {
            case Zone::Active: ++counts.active; break;
            case Zone::Nearby: ++counts.nearby; break;
            case Zone::Statistical: ++counts.statistical; break;
        }
    }
    for (District& district : districts.districts()) {
        district.zone = classifyDistrict(poi, district.centroid);
    }
    return counts;
}

} // namespace CityScale
