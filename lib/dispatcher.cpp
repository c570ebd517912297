#include "ipod/algorithms/dispatcher.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "ipod/exceptions.hpp"

namespace ipod::algorithms {

SizeType max_in_flight(SizeType max_workers) {
    if (max_workers == 0) {
        throw std::invalid_argument("max_workers must be at least 1");
    }
    return static_cast<SizeType>(
        std::ceil(static_cast<double>(max_workers) * kInFlightFactor));
}

BoundedDispatcher::BoundedDispatcher(runtime::TaskRuntime& runtime,
                                     SizeType max_workers)
    : m_runtime(runtime),
      m_max_in_flight(max_in_flight(max_workers)) {}

void BoundedDispatcher::dispatch(const ChunkPlanner& planner,
                                 const JobFactory& make_job,
                                 ResultAccumulator& totals,
                                 const MergeCallback& on_merged,
                                 const PhaseCallback& on_phase) {
    error_check::check(static_cast<bool>(make_job),
                       "BoundedDispatcher: job factory must be callable");
    m_max_outstanding = 0;
    m_num_submitted   = 0;

    std::vector<runtime::TaskId> outstanding;
    std::unordered_map<runtime::TaskId, ChunkRange> chunk_of;
    outstanding.reserve(m_max_in_flight);

    const auto enter = [&](DispatchPhase phase) {
        if (on_phase) {
            on_phase(phase);
        }
    };

    // Wait for one completion, merge it and drop it from the outstanding set
    const auto merge_one = [&]() {
        enter(DispatchPhase::kMerging);
        auto [ready, remaining] = m_runtime.wait(outstanding, 1);
        error_check::check_equal(ready.size(), 1U,
                                 "BoundedDispatcher: wait returned no task");
        const auto task_id = ready.front();
        outstanding        = std::move(remaining);
        totals.merge(m_runtime.get(task_id));
        const auto chunk = chunk_of.at(task_id);
        chunk_of.erase(task_id);
        spdlog::debug("Merged chunk [{}, {})", chunk.start, chunk.end);
        if (on_merged) {
            on_merged(chunk);
        }
    };

    try {
        for (const auto chunk : planner) {
            while (outstanding.size() >= m_max_in_flight) {
                merge_one();
            }
            enter(DispatchPhase::kSubmitting);
            const auto task_id = m_runtime.submit(make_job(chunk));
            outstanding.push_back(task_id);
            chunk_of.emplace(task_id, chunk);
            ++m_num_submitted;
            m_max_outstanding = std::max(m_max_outstanding, outstanding.size());
        }
        while (!outstanding.empty()) {
            merge_one();
        }
    } catch (const std::exception& e) {
        spdlog::error("BoundedDispatcher: aborting, waiting for {} chunk "
                      "tasks still in flight: {}",
                      outstanding.size(), e.what());
        discard_outstanding(outstanding);
        throw;
    }
}

void BoundedDispatcher::discard_outstanding(
    std::span<const runtime::TaskId> outstanding) {
    if (outstanding.empty()) {
        return;
    }
    const auto [ready, remaining] =
        m_runtime.wait(outstanding, outstanding.size());
    for (const auto task_id : ready) {
        try {
            static_cast<void>(m_runtime.get(task_id));
        } catch (const std::exception& e) {
            spdlog::debug("Dropped failed chunk task {}: {}", task_id,
                          e.what());
        }
    }
    error_check::check(remaining.empty(),
                       "BoundedDispatcher: outstanding tasks did not finish");
}

} // namespace ipod::algorithms
