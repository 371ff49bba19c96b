/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/HydrationController.hpp"
#include "core/Logger.hpp"
#include "core/SimulationRng.hpp"
#include "simulation/SimulationWorld.hpp"
#include "simulation/ZoneClassifier.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace CityScale {

namespace {

// Random probes for a district-tagged tile before settling on the centroid
constexpr int FALLBACK_TILE_PROBES = 32;

} // namespace

HydrationController::HydrationController(const HydrationConfig& config)
    : m_config(config) {}

void HydrationController::foldNeeds(District& district, const Needs& needs) {
    const float n = static_cast<float>(district.population) + 1.0f;
    if (district.population == 0) {
        district.averageNeeds = needs;
        return;
    }
    district.averageNeeds.hunger += (needs.hunger - district.averageNeeds.hunger) / n;
    district.averageNeeds.fatigue += (needs.fatigue - district.averageNeeds.fatigue) / n;
    district.averageNeeds.health += (needs.health - district.averageNeeds.health) / n;
}

bool HydrationController::dehydrate(SimulationWorld& world, IndividualId id) {
    Individual* record = world.individuals().find(id);
    if (!record) {
        return false;
    }
    District* district = world.districts().find(record->district);
    if (!district) {
        HYDRATION_ERROR("Individual " + std::to_string(id) + " has no home district " +
                        std::to_string(record->district));
        return false;
    }

    record->transition = Transition::Dehydrating;
    foldNeeds(*district, record->needs);
    district->addMember(record->occupation);
    world.lifecycle().push(LifecycleEvent{LifecycleEventType::Despawned, id, district->id, world.currentTick()});
    world.individuals().remove(id);
    return true;
}

void HydrationController::advanceTransitions(SimulationWorld& world, HydrationReport& report) {
    std::vector<IndividualId> dissolving;

    for (Individual& record : world.individuals().records()) {
        if (record.transition == Transition::Hydrating) {
            record.transition = Transition::None;
        }

        if (record.zone != Zone::Statistical) {
            if (record.transition == Transition::Buffering) {
                record.transition = Transition::None;
                record.bufferRemaining = 0;
                ++report.cancelled;
            }
            continue;
        }

        if (record.transition == Transition::None) {
            record.transition = Transition::Buffering;
            record.bufferRemaining = static_cast<uint32_t>(m_config.bufferTicks);
            ++report.enteredBuffer;
        } else if (record.transition == Transition::Buffering && record.bufferRemaining > 0) {
            --record.bufferRemaining;
        }

        if (record.transition == Transition::Buffering && record.bufferRemaining == 0) {
            dissolving.push_back(record.id);
        }
    }

    for (IndividualId id : dissolving) {
        if (dehydrate(world, id)) {
            ++report.dehydrated;
        }
    }
}

Occupation HydrationController::sampleOccupation(const District& district, SimulationRng& rng) {
    uint64_t pick = rng.uniformBelow(district.population);
    for (size_t i = 0; i < OCCUPATION_COUNT; ++i) {
        const uint64_t count = district.categoryCounts[i];
        if (pick < count) {
            return static_cast<Occupation>(i);
        }
        pick -= count;
    }
    // Unreachable while category sums match population
    return Occupation::Dependent;
}

TilePos HydrationController::samplePosition(const SimulationWorld& world, const District& district,
                                            SimulationRng& rng, BuildingId& outHome) {
    outHome = NO_BUILDING;

    if (!district.footprintPrefix.empty() && district.footprintPrefix.back() > 0) {
        const uint32_t pick = static_cast<uint32_t>(rng.uniformBelow(district.footprintPrefix.back()));
        const auto it = std::upper_bound(district.footprintPrefix.begin(), district.footprintPrefix.end(), pick);
        const size_t slot = static_cast<size_t>(it - district.footprintPrefix.begin());
        const uint32_t before = slot == 0 ? 0 : district.footprintPrefix[slot - 1];
        const Building* building = world.city().findBuilding(district.buildings[slot]);
        if (building && pick - before < building->footprint.size()) {
            outHome = building->id;
            return building->footprint[pick - before];
        }
    }

    const TileRect& b = district.bounds;
    if (!b.empty()) {
        for (int probe = 0; probe < FALLBACK_TILE_PROBES; ++probe) {
            const TilePos pos{b.x + static_cast<int32_t>(rng.uniformBelow(static_cast<uint64_t>(b.width))),
                              b.y + static_cast<int32_t>(rng.uniformBelow(static_cast<uint64_t>(b.height)))};
            if (world.tiles().getDistrictId(pos.x, pos.y) == district.id) {
                return pos;
            }
        }
    }
    return district.centroid;
}

void HydrationController::collectPlacements(const SimulationWorld& world, const District& district,
                                            const ZoneClassifier& classifier, TilePos poi,
                                            std::vector<Placement>& out) {
    out.clear();

    bool hasFootprint = false;
    for (BuildingId id : district.buildings) {
        const Building* building = world.city().findBuilding(id);
        if (!building) {
            continue;
        }
        for (const TilePos& tile : building->footprint) {
            hasFootprint = true;
            if (classifier.classify(poi, tile) != Zone::Statistical) {
                out.push_back(Placement{tile, building->id});
            }
        }
    }
    if (hasFootprint) {
        return;
    }

    // No buildings: district-tagged tiles inside the Nearby box around the POI
    const int32_t reach = static_cast<int32_t>(std::ceil(classifier.config().nearbyRadius));
    const TileRect& b = district.bounds;
    const int32_t x0 = std::max(b.x, poi.x - reach);
    const int32_t x1 = std::min(b.x + b.width - 1, poi.x + reach);
    const int32_t y0 = std::max(b.y, poi.y - reach);
    const int32_t y1 = std::min(b.y + b.height - 1, poi.y + reach);
    for (int32_t y = y0; y <= y1; ++y) {
        for (int32_t x = x0; x <= x1; ++x) {
            const TilePos tile{x, y};
            if (world.tiles().getDistrictId(x, y) == district.id &&
                classifier.classify(poi, tile) != Zone::Statistical) {
                out.push_back(Placement{tile, NO_BUILDING});
            }
        }
    }
    if (out.empty() && classifier.classify(poi, district.centroid) != Zone::Statistical) {
        out.push_back(Placement{district.centroid, NO_BUILDING});
    }
}

bool HydrationController::choosePlacement(const SimulationWorld& world, const District& district,
                                          const ZoneClassifier& classifier, TilePos poi, SimulationRng& rng,
                                          Placement& out) {
    for (int attempt = 0; attempt < m_config.placementAttempts; ++attempt) {
        BuildingId home = NO_BUILDING;
        const TilePos position = samplePosition(world, district, rng, home);
        if (classifier.classify(poi, position) != Zone::Statistical) {
            out = Placement{position, home};
            return true;
        }
    }

    // Random draws missed; pick exactly among the in-range tiles
    collectPlacements(world, district, classifier, poi, m_placements);
    if (m_placements.empty()) {
        return false;
    }
    out = m_placements[static_cast<size_t>(rng.uniformBelow(m_placements.size()))];
    return true;
}

Needs HydrationController::sampleNeeds(const District& district, SimulationRng& rng) const {
    const float noise = m_config.needNoise;
    auto jitter = [&](float mean) {
        return std::clamp(mean + rng.uniformRange(-noise, noise), 0.0f, 1.0f);
    };
    Needs needs;
    needs.hunger = jitter(district.averageNeeds.hunger);
    needs.fatigue = jitter(district.averageNeeds.fatigue);
    needs.health = jitter(district.averageNeeds.health);
    return needs;
}

IndividualId HydrationController::hydrateOne(SimulationWorld& world, DistrictId districtId,
                                             const ZoneClassifier& classifier, TilePos poi) {
    District* district = world.districts().find(districtId);
    if (!district || district->population == 0) {
        return INVALID_INDIVIDUAL;
    }
    if (world.individuals().size() >= static_cast<size_t>(m_config.maxIndividuals)) {
        return INVALID_INDIVIDUAL;
    }

    SimulationRng& rng = world.rng();

    // Only tiles inside the Nearby radius qualify; otherwise the quantum stays
    // in the district instead of spawning straight into the buffer
    Placement placement;
    if (!choosePlacement(world, *district, classifier, poi, rng, placement)) {
        return INVALID_INDIVIDUAL;
    }
    const Occupation occupation = sampleOccupation(*district, rng);

    Individual record;
    record.id = world.allocateIndividualId();
    record.position = placement.position;
    record.zone = classifier.classify(poi, placement.position);
    record.transition = Transition::Hydrating;
    record.needs = sampleNeeds(*district, rng);
    record.home = placement.home;
    record.district = district->id;
    record.occupation = occupation;
    record.spawnTick = world.currentTick();

    if (!district->removeMember(occupation)) {
        HYDRATION_ERROR("District " + std::to_string(district->id) + " category counts out of sync");
        return INVALID_INDIVIDUAL;
    }
    if (!world.individuals().insert(record)) {
        district->addMember(occupation);
        HYDRATION_ERROR("Duplicate individual id " + std::to_string(record.id));
        return INVALID_INDIVIDUAL;
    }
    world.lifecycle().push(LifecycleEvent{LifecycleEventType::Spawned, record.id, record.district, record.spawnTick});
    return record.id;
}

uint32_t HydrationController::hydrateNearest(SimulationWorld& world, const ZoneClassifier& classifier,
                                             TilePos poi) {
    const size_t live = world.individuals().size();
    const size_t cap = static_cast<size_t>(m_config.maxIndividuals);
    if (live >= cap) {
        return 0;
    }
    uint32_t budget = static_cast<uint32_t>(std::min(static_cast<size_t>(m_config.batchSize), cap - live));

    // Nearest district first; ties by id
    std::vector<std::pair<double, DistrictId>> candidates;
    for (const District& district : world.districts().districts()) {
        if (district.zone == Zone::Statistical || district.population == 0) {
            continue;
        }
        const double dx = static_cast<double>(district.centroid.x) - static_cast<double>(poi.x);
        const double dy = static_cast<double>(district.centroid.y) - static_cast<double>(poi.y);
        candidates.emplace_back(dx * dx + dy * dy, district.id);
    }
    std::sort(candidates.begin(), candidates.end());

    uint32_t spawned = 0;
    for (const auto& candidate : candidates) {
        while (budget > 0) {
            if (hydrateOne(world, candidate.second, classifier, poi) == INVALID_INDIVIDUAL) {
                break;
            }
            ++spawned;
            --budget;
        }
        if (budget == 0) {
            break;
        }
    }
    return spawned;
}

HydrationReport HydrationController::update(SimulationWorld& world, const ZoneClassifier& classifier,
                                            TilePos poi) {
    HydrationReport report;
    advanceTransitions(world, report);
    report.hydrated = hydrateNearest(world, classifier, poi);

    if (report.hydrated > 0 || report.dehydrated > 0) {
        HYDRATION_DEBUG("Tick " + std::to_string(world.currentTick()) + ": +" +
                        std::to_string(report.hydrated) + " hydrated, -" +
                        std::to_string(report.dehydrated) + " dehydrated, " +
                        std::to_string(world.individuals().size()) + " live");
    }
    return report;
}

} // namespace CityScale
