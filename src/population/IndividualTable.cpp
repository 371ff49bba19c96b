/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "population/IndividualTable.hpp"
#include <algorithm>

namespace CityScale {

bool IndividualTable::insert(const Individual& individual) {
    if (individual.id == INVALID_INDIVIDUAL || m_slots.count(individual.id) > 0) {
        return false;
    }
    m_slots.emplace(individual.id, m_records.size());
    m_records.push_back(individual);
    return true;
}

bool IndividualTable::remove(IndividualId id) {
    auto it = m_slots.find(id);
    if (it == m_slots.end()) {
        return false;
    }

    const size_t slot = it->second;
    const size_t last = m_records.size() - 1;
    if (slot != last) {
        m_records[slot] = m_records[last];
        m_slots[m_records[slot].id] = slot;
    }
    m_records.pop_back();
    m_slots.erase(it);
    return true;
}

void IndividualTable::clear() {
    m_records.clear();
    m_slots.clear();
}

Individual* IndividualTable::find(IndividualId id) {
    auto it = m_slots.find(id);
    return it == m_slots.end() ? nullptr : &m_records[it->second];
}

const Individual* IndividualTable::find(IndividualId id) const {
    auto it = m_slots.find(id);
    return it == m_slots.end() ? nullptr : &m_records[it->second];
}

size_t IndividualTable::countInZone(Zone zone) const {
    return static_cast<size_t>(std::count_if(m_records.begin(), m_records.end(),
        [zone](const Individual& ind) { return ind.zone == zone; }));
}

size_t IndividualTable::countInTransition(Transition transition) const {
    return static_cast<size_t>(std::count_if(m_records.begin(), m_records.end(),
        [transition](const Individual& ind) { return ind.transition == transition; }));
}

} // namespace CityScale
