/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TILE_TYPES_HPP
#define TILE_TYPES_HPP

#include <cstdint>
#include <functional>
#include <ostream>

namespace CityScale {

using BuildingId = uint32_t;
using BlockId = uint16_t;
using DistrictId = uint16_t;

// Tile layers use 0 for "no building / block / district"
constexpr BuildingId NO_BUILDING = 0;
constexpr BlockId NO_BLOCK = 0;
constexpr DistrictId NO_DISTRICT = 0;

enum class Terrain : uint8_t {
    Grass = 0,
    Water,
    Stone,
    Dirt,
    Sand,
    Road,
    Floor,
    Wall,
    Door,
    Courtyard,
    Garden,
    Bridge,
    Fixture,
    COUNT,

    // Returned for coordinates outside the grid, never stored
    None = 0xFF
};

inline bool isValidTerrainByte(uint8_t raw) {
    return raw < static_cast<uint8_t>(Terrain::COUNT);
}

// Equilibrium temperature in degrees Celsius for each terrain type
inline float targetTemperature(Terrain terrain) {
    switch (terrain) {
        case Terrain::Water:     return 10.0f;
        case Terrain::Bridge:    return 11.0f;
        case Terrain::Stone:     return 12.0f;
        case Terrain::Wall:      return 14.0f;
        case Terrain::Dirt:      return 14.0f;
        case Terrain::Grass:     return 15.0f;
        case Terrain::Courtyard: return 15.0f;
        case Terrain::Garden:    return 15.0f;
        case Terrain::Road:      return 16.0f;
        case Terrain::Door:      return 16.0f;
        case Terrain::Fixture:   return 17.0f;
        case Terrain::Floor:     return 18.0f;
        case Terrain::Sand:      return 18.0f;
        default:                 return 15.0f;
    }
}

inline bool isWalkable(Terrain terrain) {
    switch (terrain) {
        case Terrain::Wall:
        case Terrain::Water:
        case Terrain::Fixture:
        case Terrain::None:
        case Terrain::COUNT:
            return false;
        default:
            return true;
    }
}

// Movement multiplier applied to the straight/diagonal step cost
inline float movementWeight(Terrain terrain) {
    switch (terrain) {
        case Terrain::Grass:
        case Terrain::Dirt:
            return 1.2f;
        case Terrain::Garden:
            return 1.3f;
        case Terrain::Sand:
            return 1.5f;
        default:
            return 1.0f;
    }
}

const char* terrainName(Terrain terrain);

inline std::ostream& operator<<(std::ostream& os, Terrain terrain) {
    return os << terrainName(terrain);
}

struct TilePos {
    int32_t x{0};
    int32_t y{0};

    bool operator==(const TilePos& other) const { return x == other.x && y == other.y; }
    bool operator!=(const TilePos& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const TilePos& pos) {
    return os << "(" << pos.x << ", " << pos.y << ")";
}

// Half-open tile rectangle [x, x + width) x [y, y + height)
struct TileRect {
    int32_t x{0};
    int32_t y{0};
    int32_t width{0};
    int32_t height{0};

    bool contains(TilePos pos) const {
        return pos.x >= x && pos.y >= y && pos.x < x + width && pos.y < y + height;
    }

    bool overlaps(const TileRect& other) const {
        return x < other.x + other.width && other.x < x + width &&
               y < other.y + other.height && other.y < y + height;
    }

    // Shares an edge segment without overlapping
    bool touches(const TileRect& other) const {
        bool xTouch = (x + width == other.x || other.x + other.width == x) &&
                      y < other.y + other.height && other.y < y + height;
        bool yTouch = (y + height == other.y || other.y + other.height == y) &&
                      x < other.x + other.width && other.x < x + width;
        return xTouch || yTouch;
    }

    bool empty() const { return width <= 0 || height <= 0; }
};

} // namespace CityScale

template <> struct std::hash<CityScale::TilePos> {
    size_t operator()(const CityScale::TilePos& pos) const noexcept {
        uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(pos.x)) << 32) |
                          static_cast<uint32_t>(pos.y);
        return std::hash<uint64_t>{}(packed);
    }
};

#endif // TILE_TYPES_HPP
