#include "ipod/data/tables.hpp"

#include <algorithm>
#include <format>
#include <tuple>
#include <unordered_set>

#include "ipod/common/errors.hpp"

namespace ipod::data {

namespace {

auto time_origin_key(const Observation& obs) {
    return std::tie(obs.time.days, obs.time.nanos, obs.observatory_code);
}

auto time_code_key(const Observer& observer) {
    return std::tie(observer.time.days, observer.time.nanos, observer.code);
}

} // namespace

std::vector<OrbitID> orbit_ids(const OrbitTable& orbits) {
    std::vector<OrbitID> ids;
    ids.reserve(orbits.size());
    for (const auto& orbit : orbits.rows()) {
        ids.push_back(orbit.orbit_id);
    }
    return ids;
}

const FittedOrbit& select_orbit(const OrbitTable& orbits,
                                const OrbitID& orbit_id) {
    const auto matches = orbits.find(orbit_id);
    if (matches.empty()) {
        throw LookupError(
            orbit_id,
            std::format("Orbit {} not found in the candidate orbits", orbit_id));
    }
    if (matches.size() > 1) {
        throw LookupError(orbit_id,
                          std::format("Orbit {} appears {} times in the "
                                      "candidate orbits, expected exactly once",
                                      orbit_id, matches.size()));
    }
    return orbits.row(matches.front());
}

std::vector<ObsID> select_member_obs_ids(const MemberTable& members,
                                         const OrbitID& orbit_id) {
    const auto matches = members.find(orbit_id);
    std::vector<ObsID> obs_ids;
    obs_ids.reserve(matches.size());
    for (const auto idx : matches) {
        obs_ids.push_back(members.row(idx).obs_id);
    }
    return obs_ids;
}

std::vector<Observation>
select_observations(const ObservationTable& observations,
                    std::span<const ObsID> obs_ids) {
    // Collect positions first so the result keeps observation-table order
    std::vector<SizeType> positions;
    std::unordered_set<ObsID> seen;
    for (const auto& obs_id : obs_ids) {
        if (!seen.insert(obs_id).second) {
            continue;
        }
        const auto matches = observations.find(obs_id);
        positions.insert(positions.end(), matches.begin(), matches.end());
    }
    std::ranges::sort(positions);

    std::vector<Observation> selected;
    selected.reserve(positions.size());
    for (const auto idx : positions) {
        selected.push_back(observations.row(idx));
    }
    return selected;
}

void sort_observations(std::vector<Observation>& observations) {
    std::ranges::stable_sort(observations, [](const auto& a, const auto& b) {
        return time_origin_key(a) < time_origin_key(b);
    });
}

std::vector<Observer>
derive_observers(std::span<const Observation> observations) {
    std::vector<Observer> observers;
    observers.reserve(observations.size());
    for (const auto& obs : observations) {
        observers.push_back(
            Observer{.code = obs.observatory_code, .time = obs.time});
    }
    std::ranges::stable_sort(observers, [](const auto& a, const auto& b) {
        return time_code_key(a) < time_code_key(b);
    });
    return observers;
}

std::optional<OrbitDeterminationObservations>
build_orbit_observations(const MemberTable* members,
                         const ObservationTable* observations,
                         const OrbitID& orbit_id) {
    if (members == nullptr || observations == nullptr) {
        return std::nullopt;
    }
    const auto obs_ids = select_member_obs_ids(*members, orbit_id);
    auto orbit_observations = select_observations(*observations, obs_ids);
    sort_observations(orbit_observations);

    OrbitDeterminationObservations od_observations;
    od_observations.observers = derive_observers(orbit_observations);
    od_observations.ids.reserve(orbit_observations.size());
    for (const auto& obs : orbit_observations) {
        od_observations.ids.push_back(obs.id);
    }
    od_observations.observations = std::move(orbit_observations);
    return od_observations;
}

std::vector<ObsID> select_outlier_obs_ids(const OutlierTable* outliers,
                                          const OrbitID& orbit_id) {
    if (outliers == nullptr) {
        return {};
    }
    std::vector<ObsID> obs_ids;
    for (const auto idx : outliers->find(orbit_id)) {
        obs_ids.push_back(outliers->row(idx).obs_id);
    }
    return obs_ids;
}

} // namespace ipod::data
