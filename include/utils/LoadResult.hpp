/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOAD_RESULT_HPP
#define LOAD_RESULT_HPP

#include <ostream>

namespace CityScale {

enum class LoadResult { SUCCESS, FILE_NOT_FOUND, CORRUPT_DATA, UNSUPPORTED_VERSION };

inline std::ostream& operator<<(std::ostream& os, const LoadResult& result) {
    switch (result) {
        case LoadResult::SUCCESS: return os << "SUCCESS";
        case LoadResult::FILE_NOT_FOUND: return os << "FILE_NOT_FOUND";
        case LoadResult::CORRUPT_DATA: return os << "CORRUPT_DATA";
        case LoadResult::UNSUPPORTED_VERSION: return os << "UNSUPPORTED_VERSION";
        default: return os << "UNKNOWN";
    }
}

} // namespace CityScale

#endif // LOAD_RESULT_HPP
