/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DISTRICT_REGISTRY_HPP
#define DISTRICT_REGISTRY_HPP

#include "population/District.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <vector>

namespace CityScale {

class CityRegistry;

/**
 * @brief Owns every district, in ascending id order
 *
 * Districts are created once at load and never removed. add() rejects
 * duplicate ids and bounds that overlap an existing district.
 */
class DistrictRegistry {
public:
    bool add(District district);
    void clear();

    District* find(DistrictId id);
    const District* find(DistrictId id) const;

    std::vector<District>& districts() { return m_districts; }
    const std::vector<District>& districts() const { return m_districts; }
    size_t size() const { return m_districts.size(); }

    uint64_t totalPopulation() const;

    // Links districts whose bounds share an edge
    void computeAdjacency();

    // Copies building lists from the registry and prepares placement tables
    void bindBuildings(const CityRegistry& registry);

private:
    std::vector<District> m_districts;
    boost::container::flat_map<DistrictId, size_t> m_index;

    void reindex();
};

} // namespace CityScale

#endif // DISTRICT_REGISTRY_HPP
