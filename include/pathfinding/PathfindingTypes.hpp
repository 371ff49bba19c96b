/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDING_TYPES_HPP
#define PATHFINDING_TYPES_HPP

#include "world/TileTypes.hpp"
#include <cstdint>
#include <ostream>
#include <vector>

namespace CityScale {

enum class PathfindingResult { SUCCESS, NO_PATH_FOUND, INVALID_START, INVALID_GOAL, TIMEOUT };

// Stream operator for PathfindingResult to support test output
inline std::ostream& operator<<(std::ostream& os, const PathfindingResult& result) {
    switch (result) {
        case PathfindingResult::SUCCESS: return os << "SUCCESS";
        case PathfindingResult::NO_PATH_FOUND: return os << "NO_PATH_FOUND";
        case PathfindingResult::INVALID_START: return os << "INVALID_START";
        case PathfindingResult::INVALID_GOAL: return os << "INVALID_GOAL";
        case PathfindingResult::TIMEOUT: return os << "TIMEOUT";
        default: return os << "UNKNOWN";
    }
}

struct PathResult {
    PathfindingResult status{PathfindingResult::NO_PATH_FOUND};
    std::vector<TilePos> tiles;   // start and goal inclusive, adjacent steps only
    float cost{0.0f};

    bool found() const { return status == PathfindingResult::SUCCESS; }
};

constexpr float COST_STRAIGHT = 1.0f;
constexpr float COST_DIAGONAL = 1.41421356f;

struct PathfindingStats {
    uint64_t totalRequests{0};
    uint64_t successfulPaths{0};
    uint64_t noPathFound{0};
    uint64_t timeouts{0};
    uint64_t invalidStarts{0};
    uint64_t invalidGoals{0};
    uint64_t localSearches{0};
    uint64_t abstractSearches{0};
    uint64_t totalExpansions{0};
    uint32_t avgPathLength{0};
};

} // namespace CityScale

#endif // PATHFINDING_TYPES_HPP
