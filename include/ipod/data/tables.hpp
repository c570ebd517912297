#pragma once

#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "ipod/common/records.hpp"
#include "ipod/common/types.hpp"
#include "ipod/data/record_batch.hpp"

namespace ipod::data {

using FittedOrbits        = RecordBatch<FittedOrbit>;
using FittedOrbitMembers  = RecordBatch<FittedOrbitMember>;
using Observations        = RecordBatch<Observation>;
using PrecoveryCandidates = RecordBatch<PrecoveryCandidate>;
using SearchSummaries     = RecordBatch<SearchSummary>;
using OrbitOutliers       = RecordBatch<OrbitOutlier>;

/**
 * @brief Read-only, contiguous table of rows with a hash index on one string
 * column.
 *
 * Built once per run from a (possibly fragmented) batch and then shared by
 * every chunk task. Lookups by key return the positions of all matching
 * rows, in table order.
 *
 * @tparam Row  Row aggregate.
 * @tparam Key  Pointer to the string member the index is built on.
 */
template <typename Row, std::string Row::* Key> class KeyedTable {
public:
    KeyedTable() = default;
    explicit KeyedTable(RecordBatch<Row> batch)
        : m_rows(std::move(batch).release()) {
        m_index.reserve(m_rows.size());
        for (SizeType i = 0; i < m_rows.size(); ++i) {
            m_index[m_rows[i].*Key].push_back(i);
        }
    }
    explicit KeyedTable(std::vector<Row> rows)
        : KeyedTable(RecordBatch<Row>(std::move(rows))) {}

    [[nodiscard]] SizeType size() const noexcept { return m_rows.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_rows.empty(); }
    [[nodiscard]] std::span<const Row> rows() const noexcept {
        return m_rows;
    }
    [[nodiscard]] const Row& row(SizeType idx) const { return m_rows.at(idx); }

    // Positions of every row whose key equals key (empty if none)
    [[nodiscard]] std::span<const SizeType>
    find(const std::string& key) const {
        const auto it = m_index.find(key);
        if (it == m_index.end()) {
            return {};
        }
        return it->second;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return m_index.contains(key);
    }

private:
    std::vector<Row> m_rows;
    std::unordered_map<std::string, std::vector<SizeType>> m_index;
};

using OrbitTable       = KeyedTable<FittedOrbit, &FittedOrbit::orbit_id>;
using MemberTable      = KeyedTable<FittedOrbitMember,
                                    &FittedOrbitMember::orbit_id>;
using ObservationTable = KeyedTable<Observation, &Observation::id>;
using OutlierTable     = KeyedTable<OrbitOutlier, &OrbitOutlier::orbit_id>;

// Orbit identifiers in table order
[[nodiscard]] std::vector<OrbitID> orbit_ids(const OrbitTable& orbits);

/**
 * @brief Select the single candidate row for @p orbit_id.
 *
 * @throws LookupError if the identifier matches no row or more than one.
 */
[[nodiscard]] const FittedOrbit& select_orbit(const OrbitTable& orbits,
                                              const OrbitID& orbit_id);

// Observation ids that currently support orbit_id, in membership order
[[nodiscard]] std::vector<ObsID> select_member_obs_ids(
    const MemberTable& members, const OrbitID& orbit_id);

// Observations whose id is in obs_ids, in observation-table order
[[nodiscard]] std::vector<Observation>
select_observations(const ObservationTable& observations,
                    std::span<const ObsID> obs_ids);

// Sort by (time.days, time.nanos, observatory_code) ascending
void sort_observations(std::vector<Observation>& observations);

// One observer per observation, sorted by (time.days, time.nanos, code)
[[nodiscard]] std::vector<Observer>
derive_observers(std::span<const Observation> observations);

/**
 * @brief Assemble the observation set for one orbit.
 *
 * Selects the member observations of @p orbit_id, sorts them, derives their
 * observers and pairs the two into an OrbitDeterminationObservations. Returns
 * std::nullopt unless both tables are present.
 */
[[nodiscard]] std::optional<OrbitDeterminationObservations>
build_orbit_observations(const MemberTable* members,
                         const ObservationTable* observations,
                         const OrbitID& orbit_id);

// Observation ids flagged as known outliers of orbit_id
[[nodiscard]] std::vector<ObsID> select_outlier_obs_ids(
    const OutlierTable* outliers, const OrbitID& orbit_id);

} // namespace ipod::data
