#include "ipod/pipelines/ipod_manager.hpp"

#include <exception>
#include <format>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "ipod/algorithms/accumulator.hpp"
#include "ipod/algorithms/chunks.hpp"
#include "ipod/algorithms/dispatcher.hpp"
#include "ipod/algorithms/worker.hpp"
#include "ipod/exceptions.hpp"
#include "ipod/progress.hpp"
#include "ipod/timing.hpp"

namespace ipod::algorithms {

namespace {

using OrbitIDs = std::vector<OrbitID>;

template <typename T>
bool is_reference(const std::optional<runtime::SharedInput<T>>& input) {
    return input.has_value() && input->is_reference();
}

template <typename T>
std::shared_ptr<const T>
materialize(const std::optional<runtime::SharedInput<T>>& input,
            const runtime::ObjectStore* store) {
    if (!input.has_value()) {
        return nullptr;
    }
    if (input->is_reference()) {
        error_check::check_not_null(
            store, "IPODManager: object store references need a runtime");
        return input->materialize(*store);
    }
    return input->value();
}

template <typename T>
std::optional<runtime::ObjectRef<T>>
place(runtime::Broadcaster& broadcaster,
      const std::optional<runtime::SharedInput<T>>& input,
      std::string_view name) {
    if (!input.has_value()) {
        return std::nullopt;
    }
    const bool placed_here = !input->is_reference();
    auto ref               = broadcaster.place(*input);
    if (placed_here) {
        spdlog::info("Placed {} in the object store.", name);
    }
    return ref;
}

template <typename T>
std::shared_ptr<const T>
resolve(const runtime::ObjectStore& store,
        const std::optional<runtime::ObjectRef<T>>& ref) {
    if (!ref.has_value()) {
        return nullptr;
    }
    return store.get(*ref);
}

} // namespace

std::string_view to_string(RunState state) noexcept {
    switch (state) {
    case RunState::kEmpty:
        return "empty";
    case RunState::kPlanning:
        return "planning";
    case RunState::kDispatching:
        return "dispatching";
    case RunState::kMerging:
        return "merging";
    case RunState::kDone:
        return "done";
    case RunState::kAborted:
        return "aborted";
    }
    return "unknown";
}

std::string_view to_string(ExecutionPath path) noexcept {
    switch (path) {
    case ExecutionPath::kNone:
        return "none";
    case ExecutionPath::kSequential:
        return "sequential";
    case ExecutionPath::kLocalPool:
        return "local pool";
    case ExecutionPath::kRuntime:
        return "runtime";
    }
    return "unknown";
}

class IPODManager::BaseImpl {
public:
    BaseImpl(const search::IPODConfig& cfg,
             std::shared_ptr<refine::Refiner> refiner,
             refine::IndexOpener index_opener,
             bool show_progress)
        : m_cfg(cfg),
          m_worker(std::make_shared<const ChunkWorker>(
              std::move(refiner),
              std::move(index_opener),
              cfg.get_index_options(),
              cfg.get_refinement_params())),
          m_show_progress(show_progress) {}

    ~BaseImpl()                          = default;
    BaseImpl(const BaseImpl&)            = delete;
    BaseImpl& operator=(const BaseImpl&) = delete;
    BaseImpl(BaseImpl&&)                 = delete;
    BaseImpl& operator=(BaseImpl&&)      = delete;

    data::ResultBatches execute(const IPODInputs& inputs,
                                runtime::TaskRuntime* runtime) {
        spdlog::info("Running iterative precovery and differential "
                     "correction...");
        timing::SimpleTimer timer;
        timer.start();
        m_state           = RunState::kPlanning;
        m_path            = ExecutionPath::kNone;
        m_max_outstanding = 0;
        try {
            auto results = run(inputs, runtime);
            m_state      = RunState::kDone;
            spdlog::info("Iteratively precovered and differentially "
                         "corrected {} orbits.",
                         results.orbits.size());
            spdlog::info("Iterative precovery and differential correction "
                         "completed in {:.3f} seconds.",
                         timer.stop());
            return results;
        } catch (const std::exception& e) {
            m_state = RunState::kAborted;
            spdlog::error("Iterative precovery and differential correction "
                          "aborted: {}",
                          e.what());
            throw;
        }
    }

    [[nodiscard]] RunState get_state() const noexcept { return m_state; }
    [[nodiscard]] SizeType get_max_outstanding() const noexcept {
        return m_max_outstanding;
    }
    [[nodiscard]] ExecutionPath get_path() const noexcept { return m_path; }

private:
    search::IPODConfig m_cfg;
    std::shared_ptr<const ChunkWorker> m_worker;
    bool m_show_progress;
    RunState m_state{RunState::kEmpty};
    ExecutionPath m_path{ExecutionPath::kNone};
    SizeType m_max_outstanding{};

    data::ResultBatches run(const IPODInputs& inputs,
                            runtime::TaskRuntime* runtime) {
        const bool has_references =
            inputs.orbits.is_reference() || is_reference(inputs.members) ||
            is_reference(inputs.observations) || is_reference(inputs.outliers);
        if (runtime == nullptr && has_references) {
            throw std::invalid_argument(
                "IPODManager: inputs given as object store references need "
                "the task runtime that owns the store");
        }
        if (runtime != nullptr) {
            return run_distributed(inputs, *runtime, ExecutionPath::kRuntime);
        }
        // Empty input never starts a local pool
        const auto& orbits = inputs.orbits.value();
        if (m_cfg.get_max_workers() > 1 && orbits != nullptr &&
            !orbits->empty()) {
            runtime::ThreadPoolRuntime local_runtime(m_cfg.get_max_workers());
            return run_distributed(inputs, local_runtime,
                                   ExecutionPath::kLocalPool);
        }
        return run_sequential(inputs);
    }

    data::ResultBatches run_distributed(const IPODInputs& inputs,
                                        runtime::TaskRuntime& runtime,
                                        ExecutionPath path) {
        auto& store        = runtime.object_store();
        const auto orbits  = inputs.orbits.materialize(store);
        auto orbit_ids     = std::make_shared<const OrbitIDs>(
            data::orbit_ids(*orbits));
        const auto num_orbits = orbit_ids->size();
        if (num_orbits == 0) {
            spdlog::info("Received no orbits.");
            return {};
        }
        m_path = path;

        // Frees what it placed on every exit path
        runtime::Broadcaster broadcaster(store);
        const auto ids_ref = broadcaster.place(
            runtime::SharedInput<OrbitIDs>(std::move(orbit_ids)));
        spdlog::info("Placed orbit IDs in the object store.");
        const auto orbits_ref = broadcaster.place(inputs.orbits);
        if (!inputs.orbits.is_reference()) {
            spdlog::info("Placed orbits in the object store.");
        }
        const auto members_ref =
            place(broadcaster, inputs.members, "orbit members");
        const auto observations_ref =
            place(broadcaster, inputs.observations, "observations");
        const auto outliers_ref =
            place(broadcaster, inputs.outliers, "orbit outliers");

        const auto max_workers = m_cfg.get_max_workers();
        const auto chunk_size  = effective_chunk_size(
            num_orbits, max_workers, m_cfg.get_chunk_size());
        const ChunkPlanner planner(num_orbits, chunk_size);
        spdlog::info("Distributing orbits in chunks of {} to {} workers.",
                     chunk_size, max_workers);

        const auto make_job = [&store, worker = m_worker, ids_ref, orbits_ref,
                               members_ref, observations_ref,
                               outliers_ref](const ChunkRange& chunk) {
            return runtime::ChunkJob(
                [&store, worker, ids_ref, orbits_ref, members_ref,
                 observations_ref, outliers_ref, chunk]() {
                    const auto ids = store.get(ids_ref);
                    error_check::check_subrange(chunk.start, chunk.end,
                                                ids->size());
                    const ChunkInputs chunk_inputs{
                        .orbits       = store.get(orbits_ref),
                        .members      = resolve(store, members_ref),
                        .observations = resolve(store, observations_ref),
                        .outliers     = resolve(store, outliers_ref)};
                    return worker->process(
                        std::span<const OrbitID>(*ids).subspan(chunk.start,
                                                               chunk.size()),
                        chunk_inputs);
                });
        };

        progress::ProgressGuard progress_guard(m_show_progress);
        std::unique_ptr<progress::ProgressBar> bar;
        if (m_show_progress) {
            bar = progress::make_orbits_bar("Refining orbits", num_orbits);
        }

        ResultAccumulator totals;
        BoundedDispatcher dispatcher(runtime, max_workers);
        m_state = RunState::kDispatching;
        try {
            dispatcher.dispatch(
                planner, make_job, totals,
                [&](const ChunkRange& chunk) {
                    if (bar) {
                        bar->advance(chunk.size());
                    }
                },
                [&](DispatchPhase phase) {
                    m_state = phase == DispatchPhase::kMerging
                                  ? RunState::kMerging
                                  : RunState::kDispatching;
                });
        } catch (...) {
            m_max_outstanding = dispatcher.get_max_outstanding();
            throw;
        }
        m_max_outstanding = dispatcher.get_max_outstanding();
        broadcaster.release();
        return totals.take();
    }

    data::ResultBatches run_sequential(const IPODInputs& inputs) {
        const ChunkInputs chunk_inputs{
            .orbits       = inputs.orbits.value(),
            .members      = materialize(inputs.members, nullptr),
            .observations = materialize(inputs.observations, nullptr),
            .outliers     = materialize(inputs.outliers, nullptr)};
        error_check::check_not_null(chunk_inputs.orbits.get(),
                                    "IPODManager: candidate orbits are "
                                    "required");
        const auto orbit_ids  = data::orbit_ids(*chunk_inputs.orbits);
        const auto num_orbits = orbit_ids.size();
        if (num_orbits == 0) {
            spdlog::info("Received no orbits.");
            return {};
        }

        m_path = ExecutionPath::kSequential;

        const auto chunk_size = effective_chunk_size(
            num_orbits, m_cfg.get_max_workers(), m_cfg.get_chunk_size());
        const ChunkPlanner planner(num_orbits, chunk_size);
        spdlog::info("Processing {} orbits in {} chunks of {} on the calling "
                     "thread.",
                     num_orbits, planner.size(), chunk_size);

        progress::ProgressGuard progress_guard(m_show_progress);
        std::unique_ptr<progress::ProgressBar> bar;
        if (m_show_progress) {
            bar = progress::make_orbits_bar("Refining orbits", num_orbits);
        }

        ResultAccumulator totals;
        const std::span<const OrbitID> ids(orbit_ids);
        for (const auto chunk : planner) {
            m_state = RunState::kDispatching;
            auto chunk_results = m_worker->process(
                ids.subspan(chunk.start, chunk.size()), chunk_inputs);
            m_state = RunState::kMerging;
            totals.merge(std::move(chunk_results));
            if (bar) {
                bar->advance(chunk.size());
            }
        }
        return totals.take();
    }
};

IPODManager::IPODManager(const search::IPODConfig& cfg,
                         std::shared_ptr<refine::Refiner> refiner,
                         refine::IndexOpener index_opener,
                         bool show_progress)
    : m_impl(std::make_unique<BaseImpl>(cfg,
                                        std::move(refiner),
                                        std::move(index_opener),
                                        show_progress)) {}
IPODManager::~IPODManager()                                 = default;
IPODManager::IPODManager(IPODManager&& other) noexcept      = default;
IPODManager& IPODManager::operator=(IPODManager&& other) noexcept = default;

data::ResultBatches IPODManager::execute(const IPODInputs& inputs,
                                         runtime::TaskRuntime* runtime) {
    return m_impl->execute(inputs, runtime);
}

RunState IPODManager::get_state() const noexcept {
    return m_impl->get_state();
}

SizeType IPODManager::get_max_outstanding() const noexcept {
    return m_impl->get_max_outstanding();
}

ExecutionPath IPODManager::get_path() const noexcept {
    return m_impl->get_path();
}

data::ResultBatches iterative_precovery_and_differential_correction(
    data::FittedOrbits orbits,
    std::shared_ptr<refine::Refiner> refiner,
    refine::IndexOpener index_opener,
    std::optional<data::FittedOrbitMembers> orbit_members,
    std::optional<data::Observations> observations,
    std::optional<data::OrbitOutliers> orbit_outliers,
    const search::IPODConfig& cfg,
    runtime::TaskRuntime* runtime,
    bool show_progress) {
    IPODInputs inputs{
        .orbits = std::make_shared<const data::OrbitTable>(std::move(orbits))};
    if (orbit_members) {
        inputs.members = runtime::SharedInput<data::MemberTable>(
            std::make_shared<const data::MemberTable>(
                std::move(*orbit_members)));
    }
    if (observations) {
        inputs.observations = runtime::SharedInput<data::ObservationTable>(
            std::make_shared<const data::ObservationTable>(
                std::move(*observations)));
    }
    if (orbit_outliers) {
        inputs.outliers = runtime::SharedInput<data::OutlierTable>(
            std::make_shared<const data::OutlierTable>(
                std::move(*orbit_outliers)));
    }
    IPODManager manager(cfg, std::move(refiner), std::move(index_opener),
                        show_progress);
    return manager.execute(inputs, runtime);
}

} // namespace ipod::algorithms
