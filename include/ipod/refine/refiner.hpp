#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "ipod/common/records.hpp"
#include "ipod/common/types.hpp"
#include "ipod/data/results.hpp"
#include "ipod/data/tables.hpp"

namespace ipod::refine {

/**
 * @brief Read-only handle to a precovery search index.
 *
 * Opened once per chunk task and queried by the refinement routine. close()
 * releases the index's file resources and is called exactly once per handle
 * by the chunk worker.
 */
class PrecoveryIndex {
public:
    PrecoveryIndex()                                 = default;
    virtual ~PrecoveryIndex()                        = default;
    PrecoveryIndex(const PrecoveryIndex&)            = delete;
    PrecoveryIndex& operator=(const PrecoveryIndex&) = delete;
    PrecoveryIndex(PrecoveryIndex&&)                 = delete;
    PrecoveryIndex& operator=(PrecoveryIndex&&)      = delete;

    virtual void close() = 0;
};

struct IndexOptions {
    std::filesystem::path directory;
    bool create                 = false;
    bool read_only              = true;
    bool allow_version_mismatch = true;
};

// Opens one precovery index handle; may be called concurrently
using IndexOpener =
    std::function<std::unique_ptr<PrecoveryIndex>(const IndexOptions&)>;

/**
 * @brief Owns one open precovery index handle.
 *
 * The handle is closed exactly once: by an explicit close(), whose failure
 * propagates, or otherwise by the destructor, which logs a failure instead.
 */
class IndexHandle {
public:
    IndexHandle(const IndexOpener& opener, const IndexOptions& options);
    ~IndexHandle();
    IndexHandle(const IndexHandle&)            = delete;
    IndexHandle& operator=(const IndexHandle&) = delete;
    IndexHandle(IndexHandle&&)                 = delete;
    IndexHandle& operator=(IndexHandle&&)      = delete;

    [[nodiscard]] PrecoveryIndex& get();
    [[nodiscard]] bool is_open() const noexcept { return !m_closed; }
    void close();

private:
    std::unique_ptr<PrecoveryIndex> m_index;
    bool m_closed{false};
};

struct RefinementParams {
    double min_tolerance   = 1.0;
    double max_tolerance   = 10.0;
    double tolerance_step  = 5.0;
    double delta_time      = 15.0;
    double rchi2_threshold = 3.0;
    double outlier_chi2    = 9.0;
    double reconsider_chi2 = 8.0;
    std::optional<double> min_mjd;
    std::optional<double> max_mjd;
    std::optional<AstrometricErrors> astrometric_errors;
    std::optional<DatasetSet> datasets;
    // Observations of the current orbit already known to be outliers
    std::vector<ObsID> known_outliers;
};

// What one refinement produces for one candidate orbit
using RefinementResult = data::ResultBatches;

/**
 * @brief Iterative precovery and differential correction of one orbit.
 *
 * Implementations must be safe to call concurrently from several worker
 * threads, must not modify their inputs, and report failure by throwing.
 */
class Refiner {
public:
    Refiner()                          = default;
    virtual ~Refiner()                 = default;
    Refiner(const Refiner&)            = delete;
    Refiner& operator=(const Refiner&) = delete;
    Refiner(Refiner&&)                 = delete;
    Refiner& operator=(Refiner&&)      = delete;

    /**
     * @param candidate     Orbit to refine.
     * @param observations  Pre-associated observations, or std::nullopt to
     *                      search the index only.
     * @param index         Open precovery index of the calling worker.
     * @param params        Tolerance, threshold and time-window settings.
     */
    virtual RefinementResult
    refine(const FittedOrbit& candidate,
           const std::optional<OrbitDeterminationObservations>& observations,
           PrecoveryIndex& index,
           const RefinementParams& params) = 0;
};

} // namespace ipod::refine
