/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "config/SimulationConfig.hpp"
#include "config/SettingsStore.hpp"
#include "core/Logger.hpp"
#include <sstream>
#include <stdexcept>
#include <string>

namespace CityScale {

namespace {

// Doubles round-trip through the store as float (or string for tiny rates)
double getDouble(const SettingsStore& settings, const std::string& category,
                 const std::string& key, double defaultValue) {
    if (settings.has(category, key)) {
        std::string text = settings.get<std::string>(category, key, "");
        if (!text.empty()) {
            try {
                return std::stod(text);
            } catch (const std::exception&) {
                SETTINGS_WARNING("Ignoring non-numeric value for " + category + "." + key);
                return defaultValue;
            }
        }
    }
    return static_cast<double>(settings.get<float>(category, key, static_cast<float>(defaultValue)));
}

// std::to_string would print tiny rates as 0.000000
std::string formatDouble(double value) {
    std::ostringstream out;
    out.precision(17);
    out << value;
    return out.str();
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument("Invalid simulation config: " + message);
    }
}

} // namespace

SimulationConfig SimulationConfig::fromSettings(const SettingsStore& settings) {
    SimulationConfig config;

    config.zones.activeRadius = settings.get<float>("zones", "active_radius", config.zones.activeRadius);
    config.zones.nearbyRadius = settings.get<float>("zones", "nearby_radius", config.zones.nearbyRadius);

    auto& h = config.hydration;
    h.batchSize = settings.get<int>("hydration", "batch_size", h.batchSize);
    h.bufferTicks = settings.get<int>("hydration", "buffer_ticks", h.bufferTicks);
    h.maxIndividuals = settings.get<int>("hydration", "max_individuals", h.maxIndividuals);
    h.needNoise = settings.get<float>("hydration", "need_noise", h.needNoise);
    h.placementAttempts = settings.get<int>("hydration", "placement_attempts", h.placementAttempts);

    auto& a = config.aggregate;
    a.statisticalIntervalTicks = settings.get<int>("aggregate", "statistical_interval_ticks", a.statisticalIntervalTicks);
    a.defaultBirthRate = getDouble(settings, "aggregate", "default_birth_rate", a.defaultBirthRate);
    a.defaultDeathRate = getDouble(settings, "aggregate", "default_death_rate", a.defaultDeathRate);
    a.hungerDeathScale = getDouble(settings, "aggregate", "hunger_death_scale", a.hungerDeathScale);
    a.needRelaxRate = getDouble(settings, "aggregate", "need_relax_rate", a.needRelaxRate);
    a.fedHungerTarget = settings.get<float>("aggregate", "fed_hunger_target", a.fedHungerTarget);
    a.starvingHungerTarget = settings.get<float>("aggregate", "starving_hunger_target", a.starvingHungerTarget);
    a.fatigueTarget = settings.get<float>("aggregate", "fatigue_target", a.fatigueTarget);
    a.healthTarget = settings.get<float>("aggregate", "health_target", a.healthTarget);
    a.flowCoefficient = getDouble(settings, "aggregate", "flow_coefficient", a.flowCoefficient);

    config.temperature.relaxRate = settings.get<float>("temperature", "relax_rate", config.temperature.relaxRate);
    config.temperature.tolerance = settings.get<float>("temperature", "tolerance", config.temperature.tolerance);

    auto& p = config.pathfinding;
    p.localNodeBudget = settings.get<int>("pathfinding", "local_node_budget", p.localNodeBudget);
    p.abstractNodeBudget = settings.get<int>("pathfinding", "abstract_node_budget", p.abstractNodeBudget);
    p.entranceSplitLength = settings.get<int>("pathfinding", "entrance_split_length", p.entranceSplitLength);

    auto& n = config.needs;
    n.hungerPerTick = static_cast<float>(getDouble(settings, "needs", "hunger_per_tick", n.hungerPerTick));
    n.fatiguePerTick = static_cast<float>(getDouble(settings, "needs", "fatigue_per_tick", n.fatiguePerTick));
    n.maxNeed = settings.get<float>("needs", "max_need", n.maxNeed);
    n.nearbyCadenceTicks = settings.get<int>("needs", "nearby_cadence_ticks", n.nearbyCadenceTicks);

    config.tick.tickRateHz = settings.get<int>("tick", "rate_hz", config.tick.tickRateHz);
    config.tick.budgetMs = settings.get<float>("tick", "budget_ms", config.tick.budgetMs);

    // Seeds are kept as strings so the full 64-bit range survives JSON
    std::string seedText = settings.get<std::string>("rng", "seed", "");
    if (!seedText.empty()) {
        try {
            config.seed = std::stoull(seedText);
        } catch (const std::exception&) {
            SETTINGS_WARNING("Ignoring invalid rng.seed '" + seedText + "'");
        }
    } else if (settings.has("rng", "seed")) {
        config.seed = static_cast<uint64_t>(settings.get<int>("rng", "seed", 0));
    }

    config.validate();
    return config;
}

void SimulationConfig::toSettings(SettingsStore& settings) const {
    settings.set("zones", "active_radius", zones.activeRadius);
    settings.set("zones", "nearby_radius", zones.nearbyRadius);

    settings.set("hydration", "batch_size", hydration.batchSize);
    settings.set("hydration", "buffer_ticks", hydration.bufferTicks);
    settings.set("hydration", "max_individuals", hydration.maxIndividuals);
    settings.set("hydration", "need_noise", hydration.needNoise);
    settings.set("hydration", "placement_attempts", hydration.placementAttempts);

    settings.set("aggregate", "statistical_interval_ticks", aggregate.statisticalIntervalTicks);
    settings.set("aggregate", "default_birth_rate", formatDouble(aggregate.defaultBirthRate));
    settings.set("aggregate", "default_death_rate", formatDouble(aggregate.defaultDeathRate));
    settings.set("aggregate", "hunger_death_scale", formatDouble(aggregate.hungerDeathScale));
    settings.set("aggregate", "need_relax_rate", formatDouble(aggregate.needRelaxRate));
    settings.set("aggregate", "fed_hunger_target", aggregate.fedHungerTarget);
    settings.set("aggregate", "starving_hunger_target", aggregate.starvingHungerTarget);
    settings.set("aggregate", "fatigue_target", aggregate.fatigueTarget);
    settings.set("aggregate", "health_target", aggregate.healthTarget);
    settings.set("aggregate", "flow_coefficient", formatDouble(aggregate.flowCoefficient));

    settings.set("temperature", "relax_rate", temperature.relaxRate);
    settings.set("temperature", "tolerance", temperature.tolerance);

    settings.set("pathfinding", "local_node_budget", pathfinding.localNodeBudget);
    settings.set("pathfinding", "abstract_node_budget", pathfinding.abstractNodeBudget);
    settings.set("pathfinding", "entrance_split_length", pathfinding.entranceSplitLength);

    settings.set("needs", "hunger_per_tick", formatDouble(needs.hungerPerTick));
    settings.set("needs", "fatigue_per_tick", formatDouble(needs.fatiguePerTick));
    settings.set("needs", "max_need", needs.maxNeed);
    settings.set("needs", "nearby_cadence_ticks", needs.nearbyCadenceTicks);

    settings.set("tick", "rate_hz", tick.tickRateHz);
    settings.set("tick", "budget_ms", tick.budgetMs);

    settings.set("rng", "seed", std::to_string(seed));
}

void SimulationConfig::validate() const {
    require(zones.activeRadius > 0.0f, "zones.active_radius must be positive");
    require(zones.activeRadius < zones.nearbyRadius,
            "zones.active_radius (" + std::to_string(zones.activeRadius) +
            ") must be smaller than zones.nearby_radius (" + std::to_string(zones.nearbyRadius) + ")");

    require(hydration.batchSize > 0, "hydration.batch_size must be positive");
    require(hydration.bufferTicks >= 0, "hydration.buffer_ticks must not be negative");
    require(hydration.maxIndividuals > 0, "hydration.max_individuals must be positive");
    require(hydration.needNoise >= 0.0f, "hydration.need_noise must not be negative");
    require(hydration.placementAttempts > 0, "hydration.placement_attempts must be positive");

    require(aggregate.statisticalIntervalTicks > 0, "aggregate.statistical_interval_ticks must be positive");
    require(aggregate.defaultBirthRate >= 0.0 && aggregate.defaultDeathRate >= 0.0,
            "aggregate birth and death rates must not be negative");
    require(aggregate.needRelaxRate >= 0.0, "aggregate.need_relax_rate must not be negative");
    require(aggregate.flowCoefficient >= 0.0 && aggregate.flowCoefficient <= 0.5,
            "aggregate.flow_coefficient must lie in [0, 0.5]");

    require(temperature.relaxRate > 0.0f && temperature.relaxRate <= 1.0f,
            "temperature.relax_rate must lie in (0, 1]");
    require(temperature.tolerance >= 0.0f, "temperature.tolerance must not be negative");

    require(pathfinding.localNodeBudget > 0 && pathfinding.abstractNodeBudget > 0,
            "pathfinding node budgets must be positive");
    require(pathfinding.entranceSplitLength > 0, "pathfinding.entrance_split_length must be positive");

    require(needs.maxNeed > 0.0f, "needs.max_need must be positive");
    require(needs.nearbyCadenceTicks > 0, "needs.nearby_cadence_ticks must be positive");

    require(tick.tickRateHz > 0, "tick.rate_hz must be positive");
    require(tick.budgetMs > 0.0f, "tick.budget_ms must be positive");
}

} // namespace CityScale
