#pragma once

#include <functional>
#include <span>

#include "ipod/algorithms/accumulator.hpp"
#include "ipod/algorithms/chunks.hpp"
#include "ipod/common/types.hpp"
#include "ipod/runtime/runtime.hpp"

namespace ipod::algorithms {

// Largest number of chunk tasks allowed in flight for max_workers workers
[[nodiscard]] SizeType max_in_flight(SizeType max_workers);

// What the dispatcher is about to do next
enum class DispatchPhase { kSubmitting, kMerging };

/**
 * @brief Submits one job per chunk to a TaskRuntime while keeping at most
 * max_in_flight(max_workers) jobs outstanding.
 *
 * Jobs are submitted in plan order. When the window is full the dispatcher
 * waits for one completion, merges it into the running totals and submits
 * the next job; after the last submission it drains the remaining jobs one
 * completion at a time. A failed job aborts the dispatch at the point its
 * result is retrieved: the jobs still outstanding are waited for and
 * retrieved with their results and errors dropped, then the first error is
 * rethrown. Nothing is merged after the failure.
 */
class BoundedDispatcher {
public:
    using JobFactory    = std::function<runtime::ChunkJob(const ChunkRange&)>;
    using MergeCallback = std::function<void(const ChunkRange&)>;
    using PhaseCallback = std::function<void(DispatchPhase)>;

    BoundedDispatcher(runtime::TaskRuntime& runtime, SizeType max_workers);

    void dispatch(const ChunkPlanner& planner,
                  const JobFactory& make_job,
                  ResultAccumulator& totals,
                  const MergeCallback& on_merged = {},
                  const PhaseCallback& on_phase  = {});

    [[nodiscard]] SizeType get_max_in_flight() const noexcept {
        return m_max_in_flight;
    }
    // Largest outstanding count observed during the last dispatch
    [[nodiscard]] SizeType get_max_outstanding() const noexcept {
        return m_max_outstanding;
    }
    [[nodiscard]] SizeType get_num_submitted() const noexcept {
        return m_num_submitted;
    }

private:
    runtime::TaskRuntime& m_runtime;
    SizeType m_max_in_flight;
    SizeType m_max_outstanding{};
    SizeType m_num_submitted{};

    // Waits for and retrieves every job in outstanding, dropping the results
    void discard_outstanding(std::span<const runtime::TaskId> outstanding);
};

} // namespace ipod::algorithms
