#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include "ipod/data/results.hpp"
#include "ipod/data/tables.hpp"
#include "ipod/refine/refiner.hpp"
#include "ipod/runtime/runtime.hpp"
#include "ipod/runtime/shared_input.hpp"
#include "ipod/search/configs.hpp"

namespace ipod::algorithms {

// Lifecycle of one run; kDone and kAborted are terminal
enum class RunState {
    kEmpty,
    kPlanning,
    kDispatching,
    kMerging,
    kDone,
    kAborted
};

[[nodiscard]] std::string_view to_string(RunState state) noexcept;

// Where the chunks of the last run were executed; kNone for empty input
enum class ExecutionPath { kNone, kSequential, kLocalPool, kRuntime };

[[nodiscard]] std::string_view to_string(ExecutionPath path) noexcept;

/**
 * @brief Inputs of one run, each given by value or as an object store
 * reference.
 *
 * members and observations are only used when both are present.
 */
struct IPODInputs {
    runtime::SharedInput<data::OrbitTable> orbits;
    std::optional<runtime::SharedInput<data::MemberTable>> members;
    std::optional<runtime::SharedInput<data::ObservationTable>> observations;
    std::optional<runtime::SharedInput<data::OutlierTable>> outliers;
};

/**
 * @brief Drives iterative precovery and differential correction over a set
 * of candidate orbits.
 *
 * The run is split into contiguous chunks. With a task runtime (supplied,
 * or created locally when max_workers > 1) chunks run on its workers under
 * a bounded in-flight window; otherwise they run one after the other on the
 * calling thread. Both paths produce the same four result collections and
 * abort on the first failed orbit.
 */
class IPODManager {
public:
    IPODManager(const search::IPODConfig& cfg,
                std::shared_ptr<refine::Refiner> refiner,
                refine::IndexOpener index_opener,
                bool show_progress = true);
    ~IPODManager();
    IPODManager(IPODManager&&) noexcept;
    IPODManager& operator=(IPODManager&&) noexcept;
    IPODManager(const IPODManager&)            = delete;
    IPODManager& operator=(const IPODManager&) = delete;

    /**
     * @param inputs   Candidate orbits and optional supporting tables.
     * @param runtime  Task runtime to dispatch to, or nullptr to let the
     *                 manager choose from max_workers.
     * @return The merged results of every chunk.
     */
    [[nodiscard]] data::ResultBatches
    execute(const IPODInputs& inputs, runtime::TaskRuntime* runtime = nullptr);

    [[nodiscard]] RunState get_state() const noexcept;
    // Largest number of chunk tasks in flight during the last run
    [[nodiscard]] SizeType get_max_outstanding() const noexcept;
    [[nodiscard]] ExecutionPath get_path() const noexcept;

    // Opaque handle to the implementation
    class BaseImpl;

private:
    std::unique_ptr<BaseImpl> m_impl;
};

/**
 * @brief One-call entry point over plain row batches.
 *
 * Builds the keyed tables, runs an IPODManager and returns its results.
 */
[[nodiscard]] data::ResultBatches
iterative_precovery_and_differential_correction(
    data::FittedOrbits orbits,
    std::shared_ptr<refine::Refiner> refiner,
    refine::IndexOpener index_opener,
    std::optional<data::FittedOrbitMembers> orbit_members = std::nullopt,
    std::optional<data::Observations> observations        = std::nullopt,
    std::optional<data::OrbitOutliers> orbit_outliers     = std::nullopt,
    const search::IPODConfig& cfg                         = {},
    runtime::TaskRuntime* runtime                         = nullptr,
    bool show_progress                                    = false);

} // namespace ipod::algorithms
