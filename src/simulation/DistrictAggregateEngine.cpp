/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "simulation/DistrictAggregateEngine.hpp"
#include "core/Logger.hpp"
#include "population/DistrictRegistry.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <vector>

namespace CityScale {

namespace {

float relaxToward(float value, float target, double factor) {
    const double next = static_cast<double>(target) +
                        (static_cast<double>(value) - static_cast<double>(target)) * factor;
    return static_cast<float>(std::clamp(next, 0.0, 1.0));
}

// Applies the whole part of a fractional carry, keeping the remainder
uint32_t takeWhole(double& carry, uint32_t limit) {
    const double whole = std::floor(carry);
    if (whole < 1.0) {
        return 0;
    }
    carry -= whole;
    return static_cast<uint32_t>(std::min(whole, static_cast<double>(limit)));
}

} // namespace

DistrictAggregateEngine::DistrictAggregateEngine(const AggregateConfig& config)
    : m_config(config) {}

double DistrictAggregateEngine::effectiveDeathRate(const District& district) const {
    const double stress = std::max(0.0, static_cast<double>(district.averageNeeds.hunger) - 0.5) / 0.5;
    return district.baseDeathRate * (1.0 + m_config.hungerDeathScale * stress);
}

void DistrictAggregateEngine::removeDeaths(District& district, uint32_t deaths) {
    const uint32_t population = district.population;
    if (deaths == 0 || population == 0) {
        return;
    }

    // Largest remainder: floor of each proportional share, then one more to
    // the biggest fractional parts (lower category wins ties)
    std::array<uint32_t, OCCUPATION_COUNT> removal{};
    std::array<double, OCCUPATION_COUNT> remainder{};
    uint32_t assigned = 0;
    for (size_t i = 0; i < OCCUPATION_COUNT; ++i) {
        const double share = static_cast<double>(deaths) *
                             static_cast<double>(district.categoryCounts[i]) / static_cast<double>(population);
        removal[i] = std::min(static_cast<uint32_t>(std::floor(share)), district.categoryCounts[i]);
        remainder[i] = share - std::floor(share);
        assigned += removal[i];
    }

    std::array<size_t, OCCUPATION_COUNT> order{};
    for (size_t i = 0; i < OCCUPATION_COUNT; ++i) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return remainder[a] > remainder[b]; });

    while (assigned < deaths) {
        bool progressed = false;
        for (size_t i : order) {
            if (assigned == deaths) {
                break;
            }
            if (removal[i] < district.categoryCounts[i]) {
                ++removal[i];
                ++assigned;
                progressed = true;
            }
        }
        if (!progressed) {
            break;
        }
    }

    for (size_t i = 0; i < OCCUPATION_COUNT; ++i) {
        district.categoryCounts[i] -= removal[i];
    }
    district.population -= assigned;
}

AggregateReport DistrictAggregateEngine::advance(District& district, uint64_t tick) const {
    AggregateReport report;
    if (tick <= district.lastAdvancedTick) {
        return report;
    }
    const double elapsed = static_cast<double>(tick - district.lastAdvancedTick);
    const uint32_t startPopulation = district.population;
    const uint32_t startWorkers = district.workers();

    // Births and deaths from the population at the start of the step
    district.deathRate = effectiveDeathRate(district);
    district.deathCarry += static_cast<double>(startPopulation) * district.deathRate * elapsed;
    district.birthCarry += static_cast<double>(startPopulation) * district.birthRate * elapsed;

    report.deaths = takeWhole(district.deathCarry, startPopulation);
    removeDeaths(district, report.deaths);

    report.births = takeWhole(district.birthCarry, UINT32_MAX - district.population);
    district.categoryCounts[static_cast<size_t>(Occupation::Dependent)] += report.births;
    district.population += report.births;

    // Stockpile
    const double net = district.productionPerWorker * static_cast<double>(startWorkers) -
                       district.consumptionPerCapita * static_cast<double>(startPopulation);
    district.stockpile = std::max(0.0, district.stockpile + net * elapsed);

    // Need averages
    const double factor = std::exp(-m_config.needRelaxRate * elapsed);
    const float hungerTarget = district.stockpile <= 0.0 && startPopulation > 0
                                   ? m_config.starvingHungerTarget
                                   : m_config.fedHungerTarget;
    district.averageNeeds.hunger = relaxToward(district.averageNeeds.hunger, hungerTarget, factor);
    district.averageNeeds.fatigue = relaxToward(district.averageNeeds.fatigue, m_config.fatigueTarget, factor);
    district.averageNeeds.health = relaxToward(district.averageNeeds.health, m_config.healthTarget, factor);

    district.lastAdvancedTick = tick;

    if (report.births > 0 || report.deaths > 0) {
        AGGREGATE_DEBUG("District " + std::to_string(district.id) + " +" + std::to_string(report.births) +
                        " -" + std::to_string(report.deaths) + " over " +
                        std::to_string(static_cast<uint64_t>(elapsed)) + " ticks");
    }
    return report;
}

bool DistrictAggregateEngine::isDue(const District& district, uint64_t tick) const {
    if (tick <= district.lastAdvancedTick) {
        return false;
    }
    if (district.zone != Zone::Statistical) {
        return true;
    }
    return tick - district.lastAdvancedTick >= static_cast<uint64_t>(m_config.statisticalIntervalTicks);
}

AggregateReport DistrictAggregateEngine::advanceAll(DistrictRegistry& districts, uint64_t tick) const {
    AggregateReport total;
    for (District& district : districts.districts()) {
        if (isDue(district, tick)) {
            total += advance(district, tick);
        }
    }
    if (tick % static_cast<uint64_t>(m_config.statisticalIntervalTicks) == 0) {
        flowResources(districts);
    }
    return total;
}

void DistrictAggregateEngine::flowResources(DistrictRegistry& districts) const {
    auto& list = districts.districts();
    if (list.size() < 2 || m_config.flowCoefficient <= 0.0) {
        return;
    }

    // Collect: each adjacent pair once, from the higher stockpile to the lower
    struct Flow {
        size_t from;
        size_t to;
        double amount;
    };
    std::vector<Flow> flows;
    std::vector<double> outflow(list.size(), 0.0);
    for (size_t i = 0; i < list.size(); ++i) {
        for (DistrictId neighbourId : list[i].neighbours) {
            if (neighbourId <= list[i].id) {
                continue;
            }
            const District* neighbour = districts.find(neighbourId);
            if (!neighbour) {
                continue;
            }
            const size_t j = static_cast<size_t>(neighbour - list.data());
            const double gradient = list[i].stockpile - list[j].stockpile;
            if (gradient == 0.0) {
                continue;
            }
            const size_t from = gradient > 0.0 ? i : j;
            const size_t to = gradient > 0.0 ? j : i;
            const double amount = m_config.flowCoefficient * std::abs(gradient);
            flows.push_back(Flow{from, to, amount});
            outflow[from] += amount;
        }
    }

    // Scale so no source sends more than it holds
    std::vector<double> scale(list.size(), 1.0);
    for (size_t i = 0; i < list.size(); ++i) {
        if (outflow[i] > list[i].stockpile && outflow[i] > 0.0) {
            scale[i] = list[i].stockpile / outflow[i];
        }
    }

    // Apply
    for (const Flow& flow : flows) {
        const double amount = flow.amount * scale[flow.from];
        list[flow.from].stockpile -= amount;
        list[flow.to].stockpile += amount;
    }
    for (District& district : list) {
        district.stockpile = std::max(0.0, district.stockpile);
    }
}

} // namespace CityScale
