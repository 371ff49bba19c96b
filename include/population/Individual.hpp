/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INDIVIDUAL_HPP
#define INDIVIDUAL_HPP

#include "world/TileTypes.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>

namespace CityScale {

using IndividualId = uint64_t;
constexpr IndividualId INVALID_INDIVIDUAL = 0;

enum class Zone : uint8_t { Active, Nearby, Statistical };

// Lifecycle sub-state owned by the hydration controller
enum class Transition : uint8_t { None, Hydrating, Buffering, Dehydrating };

enum class Occupation : uint8_t {
    Laborer = 0,
    Artisan,
    Merchant,
    Servant,
    Professional,
    Dependent,
    COUNT
};

constexpr size_t OCCUPATION_COUNT = static_cast<size_t>(Occupation::COUNT);
using OccupationCounts = std::array<uint32_t, OCCUPATION_COUNT>;

inline std::ostream& operator<<(std::ostream& os, Zone zone) {
    switch (zone) {
        case Zone::Active: return os << "Active";
        case Zone::Nearby: return os << "Nearby";
        case Zone::Statistical: return os << "Statistical";
        default: return os << "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, Transition transition) {
    switch (transition) {
        case Transition::None: return os << "None";
        case Transition::Hydrating: return os << "Hydrating";
        case Transition::Buffering: return os << "Buffering";
        case Transition::Dehydrating: return os << "Dehydrating";
        default: return os << "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, Occupation occupation) {
    switch (occupation) {
        case Occupation::Laborer: return os << "Laborer";
        case Occupation::Artisan: return os << "Artisan";
        case Occupation::Merchant: return os << "Merchant";
        case Occupation::Servant: return os << "Servant";
        case Occupation::Professional: return os << "Professional";
        case Occupation::Dependent: return os << "Dependent";
        default: return os << "Unknown";
    }
}

// Need values in [0, 1]; hunger and fatigue rise, health falls
struct Needs {
    float hunger{0.0f};
    float fatigue{0.0f};
    float health{1.0f};

    bool operator==(const Needs& other) const {
        return hunger == other.hunger && fatigue == other.fatigue && health == other.health;
    }
};

/**
 * One inhabitant held as a record. Statistical population never has one;
 * a record exists only while Active, Nearby or Buffering.
 */
struct Individual {
    IndividualId id{INVALID_INDIVIDUAL};
    TilePos position;
    Zone zone{Zone::Nearby};
    Transition transition{Transition::None};
    uint32_t bufferRemaining{0};
    Needs needs;
    BuildingId home{NO_BUILDING};
    DistrictId district{NO_DISTRICT};
    Occupation occupation{Occupation::Laborer};
    uint64_t spawnTick{0};
};

} // namespace CityScale

#endif // INDIVIDUAL_HPP
