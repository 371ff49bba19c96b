/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DISTRICT_HPP
#define DISTRICT_HPP

#include "population/Individual.hpp"
#include "world/TileTypes.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace CityScale {

/**
 * @brief Aggregate population unit for one neighbourhood
 *
 * Holds everyone in the district who is not currently an individual record.
 * population always equals the sum of categoryCounts; use addMember and
 * removeMember to keep the two in step.
 */
struct District {
    DistrictId id{NO_DISTRICT};
    std::string name;
    TileRect bounds;
    TilePos centroid;

    uint32_t population{0};
    OccupationCounts categoryCounts{};
    Needs averageNeeds{0.3f, 0.4f, 0.9f};

    double birthRate{0.0};        // per person per tick
    double baseDeathRate{0.0};    // per person per tick, before hunger stress
    double deathRate{0.0};        // current effective rate
    double stockpile{0.0};
    double productionPerWorker{0.0};
    double consumptionPerCapita{0.0};

    // Fractional births and deaths not yet applied
    double birthCarry{0.0};
    double deathCarry{0.0};
    uint64_t lastAdvancedTick{0};

    // Recomputed every tick by the zone classifier
    Zone zone{Zone::Statistical};

    // Derived at load from the tile store and registry
    std::vector<BuildingId> buildings;
    std::vector<uint32_t> footprintPrefix;   // running footprint tile totals per building
    std::vector<DistrictId> neighbours;

    static District create(DistrictId id, std::string name, TileRect bounds);

    // Replaces the category breakdown and population in one step
    void seedPopulation(const OccupationCounts& counts);

    void addMember(Occupation occupation);
    // Returns false when the category is already empty
    bool removeMember(Occupation occupation);

    uint32_t categorySum() const;
    uint32_t workers() const;
};

} // namespace CityScale

#endif // DISTRICT_HPP
