/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LIFECYCLE_LOG_HPP
#define LIFECYCLE_LOG_HPP

#include "population/Individual.hpp"
#include "world/TileTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

namespace CityScale {

enum class LifecycleEventType : uint8_t {
    Spawned,     // hydrated out of a district
    Despawned,   // folded back into its district
    Died         // death reported by a behaviour system
};

inline std::ostream& operator<<(std::ostream& os, LifecycleEventType type) {
    switch (type) {
        case LifecycleEventType::Spawned: return os << "Spawned";
        case LifecycleEventType::Despawned: return os << "Despawned";
        case LifecycleEventType::Died: return os << "Died";
        default: return os << "Unknown";
    }
}

struct LifecycleEvent {
    LifecycleEventType type{LifecycleEventType::Spawned};
    IndividualId individual{INVALID_INDIVIDUAL};
    DistrictId district{NO_DISTRICT};
    uint64_t tick{0};
};

/**
 * @brief Fixed-capacity ring of identity lifecycle events
 *
 * Once full, each push overwrites the oldest entry. Storage is allocated
 * once at construction.
 */
class LifecycleLog {
public:
    static constexpr size_t DEFAULT_CAPACITY = 10000;

    // A capacity of zero is raised to one
    explicit LifecycleLog(size_t capacity = DEFAULT_CAPACITY);

    void push(const LifecycleEvent& event);
    void clear();

    // Every stored event, oldest first
    std::vector<LifecycleEvent> events() const;

    // The newest n events (fewer if the log holds fewer), oldest first
    std::vector<LifecycleEvent> recent(size_t n) const;

    // Stored events of one type for one individual
    size_t countFor(IndividualId id, LifecycleEventType type) const;

    size_t size() const { return m_count; }
    size_t capacity() const { return m_buffer.size(); }
    bool empty() const { return m_count == 0; }
    uint64_t totalPushed() const { return m_totalPushed; }

private:
    std::vector<LifecycleEvent> m_buffer;
    size_t m_writePos{0};
    size_t m_count{0};
    uint64_t m_totalPushed{0};

    size_t oldestSlot() const { return m_count < m_buffer.size() ? 0 : m_writePos; }
};

} // namespace CityScale

#endif // LIFECYCLE_LOG_HPP
