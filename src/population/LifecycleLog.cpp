/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "population/LifecycleLog.hpp"
#include <algorithm>

namespace CityScale {

LifecycleLog::LifecycleLog(size_t capacity)
    : m_buffer(std::max<size_t>(capacity, 1)) {}

void LifecycleLog::push(const LifecycleEvent& event) {
    m_buffer[m_writePos] = event;
    m_writePos = (m_writePos + 1) % m_buffer.size();
    if (m_count < m_buffer.size()) {
        ++m_count;
    }
    ++m_totalPushed;
}

void LifecycleLog::clear() {
    m_writePos = 0;
    m_count = 0;
}

std::vector<LifecycleEvent> LifecycleLog::events() const {
    return recent(m_count);
}

std::vector<LifecycleEvent> LifecycleLog::recent(size_t n) const {
    n = std::min(n, m_count);
    std::vector<LifecycleEvent> out;
    out.reserve(n);
    const size_t first = oldestSlot() + (m_count - n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(m_buffer[(first + i) % m_buffer.size()]);
    }
    return out;
}

size_t LifecycleLog::countFor(IndividualId id, LifecycleEventType type) const {
    size_t found = 0;
    const size_t first = oldestSlot();
    for (size_t i = 0; i < m_count; ++i) {
        const LifecycleEvent& event = m_buffer[(first + i) % m_buffer.size()];
        if (event.individual == id && event.type == type) {
            ++found;
        }
    }
    return found;
}

} // namespace CityScale
