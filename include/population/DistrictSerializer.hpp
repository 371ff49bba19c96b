/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DISTRICT_SERIALIZER_HPP
#define DISTRICT_SERIALIZER_HPP

#include "population/DistrictRegistry.hpp"
#include "utils/BinarySerializer.hpp"
#include "utils/LoadResult.hpp"
#include <string>

namespace CityScale {

/**
 * @brief Binary persistence for seeded district records
 *
 * Only the static and aggregate fields are stored. Building lists,
 * adjacency, carries and zone tags are derived again after load.
 */
class DistrictSerializer {
public:
    static constexpr uint32_t CURRENT_VERSION = 1;
    static constexpr uint32_t MAX_DISTRICTS = 65535;

    static bool save(const DistrictRegistry& districts, BinarySerial::Writer& writer);
    static bool saveToFile(const DistrictRegistry& districts, const std::string& path);

    // out is replaced only on SUCCESS
    static LoadResult load(BinarySerial::Reader& reader, DistrictRegistry& out);
    static LoadResult loadFromFile(const std::string& path, DistrictRegistry& out);
};

} // namespace CityScale

#endif // DISTRICT_SERIALIZER_HPP
