/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HYDRATION_CONTROLLER_HPP
#define HYDRATION_CONTROLLER_HPP

#include "config/SimulationConfig.hpp"
#include "population/District.hpp"
#include "population/Individual.hpp"
#include "world/TileTypes.hpp"
#include <cstdint>
#include <vector>

namespace CityScale {

class SimulationRng;
class SimulationWorld;
class ZoneClassifier;

struct HydrationReport {
    uint32_t hydrated{0};
    uint32_t dehydrated{0};
    uint32_t enteredBuffer{0};
    uint32_t cancelled{0};   // buffered records that came back in range
};

/**
 * @brief Moves population between district statistics and individual records
 *
 * Each move is a single step: a district loses one member in the same call
 * that creates the record, and gains one in the same call that removes it,
 * so the total modeled population never changes here.
 *
 * Records classified Statistical are held in Buffering for bufferTicks
 * before they dissolve. Coming back into range during the buffer cancels
 * the dissolve with the record's identity intact.
 */
class HydrationController {
public:
    explicit HydrationController(const HydrationConfig& config);

    // Runs after the zone classifier has tagged records and districts
    HydrationReport update(SimulationWorld& world, const ZoneClassifier& classifier, TilePos poi);

    /**
     * @brief Creates one record from a district's statistics
     *
     * The record is placed on a footprint tile (or, for a district without
     * buildings, a district tile) within the Nearby radius of poi.
     * @return the new id, or INVALID_INDIVIDUAL if the district is empty or
     * unknown, the record cap is reached, or no placement is in range
     */
    IndividualId hydrateOne(SimulationWorld& world, DistrictId districtId, const ZoneClassifier& classifier,
                            TilePos poi);

    // Folds a record back into its home district and removes it
    bool dehydrate(SimulationWorld& world, IndividualId id);

    // Incremental mean of a record's needs into district averages of size population
    static void foldNeeds(District& district, const Needs& needs);

    const HydrationConfig& config() const { return m_config; }

private:
    struct Placement {
        TilePos position;
        BuildingId home{NO_BUILDING};
    };

    HydrationConfig m_config;
    std::vector<Placement> m_placements;   // scratch for exhaustive placement

    void advanceTransitions(SimulationWorld& world, HydrationReport& report);
    uint32_t hydrateNearest(SimulationWorld& world, const ZoneClassifier& classifier, TilePos poi);

    static Occupation sampleOccupation(const District& district, SimulationRng& rng);
    static TilePos samplePosition(const SimulationWorld& world, const District& district, SimulationRng& rng,
                                  BuildingId& outHome);
    static void collectPlacements(const SimulationWorld& world, const District& district,
                                  const ZoneClassifier& classifier, TilePos poi, std::vector<Placement>& out);
    bool choosePlacement(const SimulationWorld& world, const District& district, const ZoneClassifier& classifier,
                         TilePos poi, SimulationRng& rng, Placement& out);
    Needs sampleNeeds(const District& district, SimulationRng& rng) const;
};

} // namespace CityScale

#endif // HYDRATION_CONTROLLER_HPP
