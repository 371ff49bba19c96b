/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INDIVIDUAL_TABLE_HPP
#define INDIVIDUAL_TABLE_HPP

#include "population/Individual.hpp"
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace CityScale {

/**
 * @brief Dense storage for individual records
 *
 * Records are contiguous for per-tick sweeps. Removal swaps the last record
 * into the hole, so iteration order depends only on the sequence of inserts
 * and removals and is identical between replays.
 */
class IndividualTable {
public:
    // Returns false if a record with the same id already exists
    bool insert(const Individual& individual);
    bool remove(IndividualId id);
    void clear();

    Individual* find(IndividualId id);
    const Individual* find(IndividualId id) const;
    bool contains(IndividualId id) const { return m_slots.count(id) > 0; }

    size_t size() const { return m_records.size(); }
    bool empty() const { return m_records.empty(); }
    size_t countInZone(Zone zone) const;
    size_t countInTransition(Transition transition) const;

    std::vector<Individual>& records() { return m_records; }
    const std::vector<Individual>& records() const { return m_records; }

private:
    std::vector<Individual> m_records;
    std::unordered_map<IndividualId, size_t> m_slots;
};

} // namespace CityScale

#endif // INDIVIDUAL_TABLE_HPP
