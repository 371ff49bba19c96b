/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include <cstdint>

namespace CityScale {

class SettingsStore;

struct ZoneConfig {
    float activeRadius{150.0f};   // tiles
    float nearbyRadius{500.0f};   // tiles
};

struct HydrationConfig {
    int batchSize{100};              // individuals spawned per tick, across all districts
    int bufferTicks{200};            // grace period before a Statistical record dehydrates
    int maxIndividuals{54000};       // hard cap on live individual records
    float needNoise{0.1f};           // half-width of the uniform noise added to sampled needs
    int placementAttempts{8};        // tries to land a spawn within the Nearby radius
};

struct AggregateConfig {
    int statisticalIntervalTicks{100};    // Statistical districts advance at this cadence
    double defaultBirthRate{2.0e-7};      // per person per tick
    double defaultDeathRate{1.5e-7};      // per person per tick
    double hungerDeathScale{4.0};         // extra death-rate multiplier at full hunger stress
    double needRelaxRate{0.001};          // e^-k relaxation of need averages per tick
    float fedHungerTarget{0.3f};
    float starvingHungerTarget{0.9f};
    float fatigueTarget{0.4f};
    float healthTarget{0.9f};
    double flowCoefficient{0.05};         // share of the stockpile gradient moved per flow step
};

struct TemperatureConfig {
    float relaxRate{0.02f};      // fraction of the gap to equilibrium closed per tick
    float tolerance{0.01f};      // degrees; closer than this snaps to equilibrium
};

struct PathfindingConfig {
    int localNodeBudget{20000};      // tile-level A* expansions per local search
    int abstractNodeBudget{40000};   // abstract graph expansions per query
    int entranceSplitLength{6};      // entrances longer than this get two portals
};

struct NeedsConfig {
    float hungerPerTick{0.0001f};
    float fatiguePerTick{0.00005f};
    float maxNeed{1.0f};
    int nearbyCadenceTicks{10};      // Nearby and Buffering records update every N ticks
};

struct TickConfig {
    int tickRateHz{100};
    float budgetMs{10.0f};
};

/**
 * @brief Typed view of every tunable in the simulation
 *
 * Built from a SettingsStore; missing keys keep the defaults above.
 */
struct SimulationConfig {
    ZoneConfig zones;
    HydrationConfig hydration;
    AggregateConfig aggregate;
    TemperatureConfig temperature;
    PathfindingConfig pathfinding;
    NeedsConfig needs;
    TickConfig tick;
    uint64_t seed{0x5EEDC17Eull};

    static SimulationConfig fromSettings(const SettingsStore& settings);

    // Writes every field back under the same category/key names
    void toSettings(SettingsStore& settings) const;

    /**
     * @throws std::invalid_argument if activeRadius >= nearbyRadius or any
     * size, rate or budget is out of range
     */
    void validate() const;
};

} // namespace CityScale

#endif // SIMULATION_CONFIG_HPP
