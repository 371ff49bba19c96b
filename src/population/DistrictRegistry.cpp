/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "population/DistrictRegistry.hpp"
#include "core/Logger.hpp"
#include "world/CityRegistry.hpp"
#include <algorithm>
#include <string>

namespace CityScale {

bool DistrictRegistry::add(District district) {
    if (district.id == NO_DISTRICT) {
        REGISTRY_ERROR("District id 0 is reserved");
        return false;
    }
    if (m_index.count(district.id) > 0) {
        REGISTRY_ERROR("Duplicate district id " + std::to_string(district.id));
        return false;
    }
    for (const District& existing : m_districts) {
        if (existing.bounds.overlaps(district.bounds)) {
            REGISTRY_ERROR("District " + std::to_string(district.id) + " overlaps district " +
                           std::to_string(existing.id));
            return false;
        }
    }

    auto pos = std::lower_bound(m_districts.begin(), m_districts.end(), district.id,
                                [](const District& d, DistrictId id) { return d.id < id; });
    m_districts.insert(pos, std::move(district));
    reindex();
    return true;
}

void DistrictRegistry::clear() {
    m_districts.clear();
    m_index.clear();
}

void DistrictRegistry::reindex() {
    m_index.clear();
    m_index.reserve(m_districts.size());
    for (size_t i = 0; i < m_districts.size(); ++i) {
        m_index.emplace_hint(m_index.end(), m_districts[i].id, i);
    }
}

District* DistrictRegistry::find(DistrictId id) {
    auto it = m_index.find(id);
    return it == m_index.end() ? nullptr : &m_districts[it->second];
}

const District* DistrictRegistry::find(DistrictId id) const {
    auto it = m_index.find(id);
    return it == m_index.end() ? nullptr : &m_districts[it->second];
}

uint64_t DistrictRegistry::totalPopulation() const {
    uint64_t total = 0;
    for (const District& district : m_districts) {
        total += district.population;
    }
    return total;
}

void DistrictRegistry::computeAdjacency() {
    for (District& district : m_districts) {
        district.neighbours.clear();
    }
    for (size_t i = 0; i < m_districts.size(); ++i) {
        for (size_t j = i + 1; j < m_districts.size(); ++j) {
            if (m_districts[i].bounds.touches(m_districts[j].bounds)) {
                m_districts[i].neighbours.push_back(m_districts[j].id);
                m_districts[j].neighbours.push_back(m_districts[i].id);
            }
        }
    }
    for (District& district : m_districts) {
        std::sort(district.neighbours.begin(), district.neighbours.end());
    }
}

void DistrictRegistry::bindBuildings(const CityRegistry& registry) {
    for (District& district : m_districts) {
        district.buildings = registry.buildingsInDistrict(district.id);
        district.footprintPrefix.clear();
        district.footprintPrefix.reserve(district.buildings.size());

        uint32_t running = 0;
        for (BuildingId id : district.buildings) {
            const Building* building = registry.findBuilding(id);
            running += building ? static_cast<uint32_t>(building->footprint.size()) : 0;
            district.footprintPrefix.push_back(running);
        }

        if (district.buildings.empty() && district.population > 0) {
            REGISTRY_WARN("District " + std::to_string(district.id) +
                          " has population but no building footprints");
        }
    }
}

} // namespace CityScale
