/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "population/District.hpp"
#include <numeric>

namespace CityScale {

District District::create(DistrictId id, std::string name, TileRect bounds) {
    District district;
    district.id = id;
    district.name = std::move(name);
    district.bounds = bounds;
    district.centroid = TilePos{bounds.x + bounds.width / 2, bounds.y + bounds.height / 2};
    return district;
}

void District::seedPopulation(const OccupationCounts& counts) {
    categoryCounts = counts;
    population = categorySum();
}

void District::addMember(Occupation occupation) {
    ++categoryCounts[static_cast<size_t>(occupation)];
    ++population;
}

bool District::removeMember(Occupation occupation) {
    uint32_t& count = categoryCounts[static_cast<size_t>(occupation)];
    if (count == 0 || population == 0) {
        return false;
    }
    --count;
    --population;
    return true;
}

uint32_t District::categorySum() const {
    return std::accumulate(categoryCounts.begin(), categoryCounts.end(), uint32_t{0});
}

uint32_t District::workers() const {
    return population - categoryCounts[static_cast<size_t>(Occupation::Dependent)];
}

} // namespace CityScale
