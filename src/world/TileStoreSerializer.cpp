/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/TileStoreSerializer.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>

namespace CityScale {

namespace {

constexpr char TILE_FORMAT_TAG[8] = {'C', 'S', 'T', 'I', 'L', 'E', 'S', '\0'};

bool writeHeader(BinarySerial::Writer& writer, const TileFileHeader& header) {
    return writer.writeArray(header.formatTag, sizeof(header.formatTag)) &&
           writer.write(header.version) &&
           writer.write(header.width) &&
           writer.write(header.height) &&
           writer.write(header.generation);
}

bool readHeader(BinarySerial::Reader& reader, TileFileHeader& header) {
    return reader.readArray(header.formatTag, sizeof(header.formatTag)) &&
           reader.read(header.version) &&
           reader.read(header.width) &&
           reader.read(header.height) &&
           reader.read(header.generation);
}

} // namespace

bool TileStoreSerializer::save(const TileStore& store, BinarySerial::Writer& writer) {
    TileFileHeader header;
    header.version = CURRENT_VERSION;
    header.width = static_cast<uint32_t>(store.width());
    header.height = static_cast<uint32_t>(store.height());
    header.generation = store.generation();

    if (!writeHeader(writer, header)) {
        SERIAL_ERROR("Failed to write tile store header");
        return false;
    }

    for (int32_t cy = 0; cy < store.chunksPerColumn(); ++cy) {
        for (int32_t cx = 0; cx < store.chunksPerRow(); ++cx) {
            const Chunk& chunk = store.chunkAt(cx, cy);
            bool ok = writer.writeArray(chunk.terrain.data(), chunk.terrain.size()) &&
                      writer.writeArray(chunk.building.data(), chunk.building.size()) &&
                      writer.writeArray(chunk.block.data(), chunk.block.size()) &&
                      writer.writeArray(chunk.district.data(), chunk.district.size());
            if (!ok) {
                SERIAL_ERROR("Failed to write chunk " + std::to_string(cx) + "," + std::to_string(cy));
                return false;
            }
        }
    }

    writer.flush();
    return writer.good();
}

bool TileStoreSerializer::saveToFile(const TileStore& store, const std::string& path) {
    auto writer = BinarySerial::Writer::createFileWriter(path);
    if (!writer) {
        return false;
    }
    if (!save(store, *writer)) {
        return false;
    }
    SERIAL_INFO("Saved " + std::to_string(store.width()) + "x" + std::to_string(store.height()) +
                " tile store to " + path);
    return true;
}

LoadResult TileStoreSerializer::load(BinarySerial::Reader& reader, std::unique_ptr<TileStore>& out) {
    TileFileHeader header;
    if (!readHeader(reader, header)) {
        SERIAL_ERROR("Tile data truncated inside header");
        return LoadResult::CORRUPT_DATA;
    }
    if (std::memcmp(header.formatTag, TILE_FORMAT_TAG, sizeof(TILE_FORMAT_TAG)) != 0) {
        SERIAL_ERROR("Tile data has an unknown format tag");
        return LoadResult::CORRUPT_DATA;
    }
    if (header.version != CURRENT_VERSION) {
        SERIAL_ERROR("Unsupported tile format version " + std::to_string(header.version));
        return LoadResult::UNSUPPORTED_VERSION;
    }
    if (header.width == 0 || header.height == 0 ||
        header.width > MAX_DIMENSION || header.height > MAX_DIMENSION) {
        SERIAL_ERROR("Tile data has invalid dimensions " + std::to_string(header.width) + "x" +
                     std::to_string(header.height));
        return LoadResult::CORRUPT_DATA;
    }

    auto store = std::make_unique<TileStore>(static_cast<int32_t>(header.width),
                                             static_cast<int32_t>(header.height));

    for (int32_t cy = 0; cy < store->chunksPerColumn(); ++cy) {
        for (int32_t cx = 0; cx < store->chunksPerRow(); ++cx) {
            Chunk& chunk = store->chunkAt(cx, cy);
            bool ok = reader.readArray(chunk.terrain.data(), chunk.terrain.size()) &&
                      reader.readArray(chunk.building.data(), chunk.building.size()) &&
                      reader.readArray(chunk.block.data(), chunk.block.size()) &&
                      reader.readArray(chunk.district.data(), chunk.district.size());
            if (!ok) {
                SERIAL_ERROR("Tile data truncated in chunk " + std::to_string(cx) + "," + std::to_string(cy));
                return LoadResult::CORRUPT_DATA;
            }

            auto invalid = std::find_if(chunk.terrain.begin(), chunk.terrain.end(),
                                        [](uint8_t raw) { return !isValidTerrainByte(raw); });
            if (invalid != chunk.terrain.end()) {
                SERIAL_ERROR("Unknown terrain value " + std::to_string(*invalid) + " in chunk " +
                             std::to_string(cx) + "," + std::to_string(cy));
                return LoadResult::CORRUPT_DATA;
            }
        }
    }

    if (!reader.atEnd()) {
        SERIAL_ERROR("Unexpected trailing bytes after tile data");
        return LoadResult::CORRUPT_DATA;
    }

    store->setGeneration(header.generation);
    store->initializeTemperatures();
    store->clearDirtyFlags();
    out = std::move(store);
    return LoadResult::SUCCESS;
}

LoadResult TileStoreSerializer::loadFromFile(const std::string& path, std::unique_ptr<TileStore>& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        SERIAL_ERROR("Tile file does not exist: " + path);
        return LoadResult::FILE_NOT_FOUND;
    }

    auto reader = BinarySerial::Reader::createFileReader(path);
    if (!reader) {
        return LoadResult::FILE_NOT_FOUND;
    }
    LoadResult result = load(*reader, out);
    if (result == LoadResult::SUCCESS) {
        SERIAL_INFO("Loaded tile store from " + path);
    }
    return result;
}

} // namespace CityScale
