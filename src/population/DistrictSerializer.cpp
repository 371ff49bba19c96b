/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "population/DistrictSerializer.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <cstring>
#include <filesystem>

namespace CityScale {

namespace {

constexpr char DISTRICT_FORMAT_TAG[8] = {'C', 'S', 'D', 'I', 'S', 'T', 'R', '\0'};

bool writeDistrict(BinarySerial::Writer& writer, const District& d) {
    return writer.write(d.id) &&
           writer.writeString(d.name) &&
           writer.write(d.bounds.x) && writer.write(d.bounds.y) &&
           writer.write(d.bounds.width) && writer.write(d.bounds.height) &&
           writer.write(d.centroid.x) && writer.write(d.centroid.y) &&
           writer.writeArray(d.categoryCounts.data(), d.categoryCounts.size()) &&
           writer.write(d.averageNeeds.hunger) &&
           writer.write(d.averageNeeds.fatigue) &&
           writer.write(d.averageNeeds.health) &&
           writer.write(d.birthRate) &&
           writer.write(d.baseDeathRate) &&
           writer.write(d.stockpile) &&
           writer.write(d.productionPerWorker) &&
           writer.write(d.consumptionPerCapita);
}

bool readDistrict(BinarySerial::Reader& reader, District& d) {
    return reader.read(d.id) &&
           reader.readString(d.name) &&
           reader.read(d.bounds.x) && reader.read(d.bounds.y) &&
           reader.read(d.bounds.width) && reader.read(d.bounds.height) &&
           reader.read(d.centroid.x) && reader.read(d.centroid.y) &&
           reader.readArray(d.categoryCounts.data(), d.categoryCounts.size()) &&
           reader.read(d.averageNeeds.hunger) &&
           reader.read(d.averageNeeds.fatigue) &&
           reader.read(d.averageNeeds.health) &&
           reader.read(d.birthRate) &&
           reader.read(d.baseDeathRate) &&
           reader.read(d.stockpile) &&
           reader.read(d.productionPerWorker) &&
           reader.read(d.consumptionPerCapita);
}

bool inUnitRange(float value) {
    return std::isfinite(value) && value >= 0.0f && value <= 1.0f;
}

bool nonNegative(double value) {
    return std::isfinite(value) && value >= 0.0;
}

bool isPlausible(const District& d) {
    uint64_t sum = 0;
    for (uint32_t count : d.categoryCounts) {
        sum += count;
    }
    return !d.bounds.empty() &&
           sum <= UINT32_MAX &&
           inUnitRange(d.averageNeeds.hunger) &&
           inUnitRange(d.averageNeeds.fatigue) &&
           inUnitRange(d.averageNeeds.health) &&
           nonNegative(d.birthRate) && nonNegative(d.baseDeathRate) &&
           nonNegative(d.stockpile) &&
           nonNegative(d.productionPerWorker) && nonNegative(d.consumptionPerCapita);
}

} // namespace

bool DistrictSerializer::save(const DistrictRegistry& districts, BinarySerial::Writer& writer) {
    const uint32_t count = static_cast<uint32_t>(districts.size());
    if (!writer.writeArray(DISTRICT_FORMAT_TAG, sizeof(DISTRICT_FORMAT_TAG)) ||
        !writer.write(CURRENT_VERSION) || !writer.write(count)) {
        SERIAL_ERROR("Failed to write district header");
        return false;
    }

    for (const District& district : districts.districts()) {
        if (!writeDistrict(writer, district)) {
            SERIAL_ERROR("Failed to write district " + std::to_string(district.id));
            return false;
        }
    }
    writer.flush();
    return writer.good();
}

bool DistrictSerializer::saveToFile(const DistrictRegistry& districts, const std::string& path) {
    auto writer = BinarySerial::Writer::createFileWriter(path);
    return writer && save(districts, *writer);
}

LoadResult DistrictSerializer::load(BinarySerial::Reader& reader, DistrictRegistry& out) {
    char tag[8]{};
    uint32_t version = 0;
    uint32_t count = 0;
    if (!reader.readArray(tag, sizeof(tag)) || !reader.read(version) || !reader.read(count)) {
        SERIAL_ERROR("District data truncated inside header");
        return LoadResult::CORRUPT_DATA;
    }
    if (std::memcmp(tag, DISTRICT_FORMAT_TAG, sizeof(tag)) != 0) {
        SERIAL_ERROR("District data has an unknown format tag");
        return LoadResult::CORRUPT_DATA;
    }
    if (version != CURRENT_VERSION) {
        SERIAL_ERROR("Unsupported district format version " + std::to_string(version));
        return LoadResult::UNSUPPORTED_VERSION;
    }
    if (count > MAX_DISTRICTS) {
        SERIAL_ERROR("District count " + std::to_string(count) + " exceeds limit");
        return LoadResult::CORRUPT_DATA;
    }

    DistrictRegistry loaded;
    for (uint32_t i = 0; i < count; ++i) {
        District district;
        if (!readDistrict(reader, district)) {
            SERIAL_ERROR("District data truncated at record " + std::to_string(i));
            return LoadResult::CORRUPT_DATA;
        }
        if (!isPlausible(district)) {
            SERIAL_ERROR("District " + std::to_string(district.id) + " has out-of-range values");
            return LoadResult::CORRUPT_DATA;
        }
        district.seedPopulation(district.categoryCounts);
        district.deathRate = district.baseDeathRate;
        if (!loaded.add(std::move(district))) {
            return LoadResult::CORRUPT_DATA;
        }
    }

    if (!reader.atEnd()) {
        SERIAL_ERROR("Unexpected trailing bytes after district data");
        return LoadResult::CORRUPT_DATA;
    }

    loaded.computeAdjacency();
    out = std::move(loaded);
    return LoadResult::SUCCESS;
}

LoadResult DistrictSerializer::loadFromFile(const std::string& path, DistrictRegistry& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        SERIAL_ERROR("District file does not exist: " + path);
        return LoadResult::FILE_NOT_FOUND;
    }
    auto reader = BinarySerial::Reader::createFileReader(path);
    if (!reader) {
        return LoadResult::FILE_NOT_FOUND;
    }
    return load(*reader, out);
}

} // namespace CityScale
