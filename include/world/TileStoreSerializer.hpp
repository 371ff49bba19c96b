/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TILE_STORE_SERIALIZER_HPP
#define TILE_STORE_SERIALIZER_HPP

#include "utils/BinarySerializer.hpp"
#include "utils/LoadResult.hpp"
#include "world/TileStore.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace CityScale {

// Fixed-size file header, written field by field
struct TileFileHeader {
    char formatTag[8]{'C', 'S', 'T', 'I', 'L', 'E', 'S', '\0'};
    uint32_t version{1};
    uint32_t width{0};
    uint32_t height{0};
    uint64_t generation{0};
};

/**
 * @brief Binary persistence for the tile store
 *
 * Layout: header, then every chunk in row-major chunk order, each holding
 * terrain (u8), building (u32), block (u16) and district (u16) layers of
 * 4096 entries. Temperature is never written; loads rebuild it from terrain.
 */
class TileStoreSerializer {
public:
    static constexpr uint32_t CURRENT_VERSION = 1;
    static constexpr uint32_t MAX_DIMENSION = 16384;

    static bool save(const TileStore& store, BinarySerial::Writer& writer);
    static bool saveToFile(const TileStore& store, const std::string& path);

    /**
     * @brief Reads a complete tile store
     *
     * out is only assigned on SUCCESS; any malformed, truncated or
     * over-long input leaves it untouched.
     */
    static LoadResult load(BinarySerial::Reader& reader, std::unique_ptr<TileStore>& out);
    static LoadResult loadFromFile(const std::string& path, std::unique_ptr<TileStore>& out);
};

} // namespace CityScale

#endif // TILE_STORE_SERIALIZER_HPP
