#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <vector>

#include "ipod/common/types.hpp"

namespace ipod {

/**
 * @brief Time as MJD day number plus nanoseconds into the day.
 *
 * Ordered lexicographically on (days, nanos), which is the ordering used to
 * sort observations before they are handed to orbit determination.
 */
struct Timestamp {
    std::int64_t days{};
    std::int64_t nanos{};

    [[nodiscard]] double mjd() const noexcept {
        return static_cast<double>(days) +
               (static_cast<double>(nanos) / kNanosPerDay);
    }

    auto operator<=>(const Timestamp&) const = default;
};

struct FittedOrbit {
    OrbitID orbit_id;
    std::string object_id;
    double x{};
    double y{};
    double z{};
    double vx{};
    double vy{};
    double vz{};
    Timestamp epoch;
    double arc_length{};
    std::int64_t num_obs{};
    double chi2{};
    double reduced_chi2{};
    std::int64_t iterations{};
    bool success{};
    std::int64_t status_code{};
};

struct FittedOrbitMember {
    OrbitID orbit_id;
    ObsID obs_id;
    double residual_ra{};
    double residual_dec{};
    double chi2{};
    bool solution{};
    bool outlier{};
};

struct Observation {
    ObsID id;
    std::string exposure_id;
    Timestamp time;
    double ra{};
    double dec{};
    double sigma_ra{};
    double sigma_dec{};
    double mag{};
    std::string observatory_code;
};

// Observer that recorded an observation
struct Observer {
    std::string code;
    Timestamp time;
};

/**
 * @brief The observation set handed to the refinement routine.
 *
 * The three vectors are parallel: entry i of each describes the same
 * detection.
 */
struct OrbitDeterminationObservations {
    std::vector<ObsID> ids;
    std::vector<Observation> observations;
    std::vector<Observer> observers;

    [[nodiscard]] SizeType size() const noexcept { return ids.size(); }
    [[nodiscard]] bool empty() const noexcept { return ids.empty(); }
};

struct PrecoveryCandidate {
    OrbitID orbit_id;
    ObsID observation_id;
    std::string exposure_id;
    std::string dataset_id;
    Timestamp time;
    double ra{};
    double dec{};
    double sigma_ra{};
    double sigma_dec{};
    double mag{};
    std::string filter;
    std::string observatory_code;
    double pred_ra{};
    double pred_dec{};
    double delta_ra_arcsec{};
    double delta_dec_arcsec{};
    double distance_arcsec{};
};

struct SearchSummary {
    OrbitID orbit_id;
    double min_mjd{};
    double max_mjd{};
    std::int64_t num_candidates{};
    std::int64_t num_accepted{};
    std::int64_t num_rejected{};
    double arc_length{};
    std::int64_t iterations{};
};

struct OrbitOutlier {
    OrbitID orbit_id;
    ObsID obs_id;
};

} // namespace ipod
