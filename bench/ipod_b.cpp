#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <random>
#include <vector>

#include <benchmark/benchmark.h>
#include <omp.h>
#include <spdlog/spdlog.h>

#include "ipod/algorithms/accumulator.hpp"
#include "ipod/algorithms/chunks.hpp"
#include "ipod/pipelines/ipod_manager.hpp"

namespace ipod::algorithms {

namespace {

class NullIndex final : public refine::PrecoveryIndex {
public:
    void close() override {}
};

// Emits one row per collection and orbit without fitting anything
class EchoRefiner final : public refine::Refiner {
public:
    refine::RefinementResult
    refine(const FittedOrbit& candidate,
           const std::optional<OrbitDeterminationObservations>& /*obs*/,
           refine::PrecoveryIndex& /*index*/,
           const refine::RefinementParams& /*params*/) override {
        refine::RefinementResult result;
        result.orbits.push_back(candidate);
        result.members.push_back(FittedOrbitMember{
            .orbit_id = candidate.orbit_id, .obs_id = candidate.orbit_id});
        result.summaries.push_back(
            SearchSummary{.orbit_id = candidate.orbit_id});
        return result;
    }
};

data::FittedOrbits generate_orbits(SizeType num_orbits, std::mt19937& gen) {
    std::uniform_real_distribution<double> dis(-3.0, 3.0);
    data::FittedOrbits orbits;
    for (SizeType i = 0; i < num_orbits; ++i) {
        orbits.push_back(FittedOrbit{.orbit_id = std::format("o{:06d}", i),
                                     .x        = dis(gen),
                                     .y        = dis(gen),
                                     .z        = dis(gen)});
    }
    return orbits;
}

} // namespace

class AccumulatorFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        nchunks = state.range(0);
        std::random_device rd;
        std::mt19937 gen(rd());
        chunk_orbits = generate_orbits(kRowsPerChunk, gen);
    }

    void TearDown(const ::benchmark::State& /*unused*/) override {}

    data::ResultBatches make_chunk() const {
        data::ResultBatches chunk;
        chunk.orbits = chunk_orbits;
        return chunk;
    }

    static constexpr SizeType kRowsPerChunk = 16;
    size_t nchunks{};
    data::FittedOrbits chunk_orbits;
};

class ManagerFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        norbits = state.range(0);
        spdlog::set_level(spdlog::level::warn);
        std::random_device rd;
        std::mt19937 gen(rd());
        orbits = generate_orbits(norbits, gen);
    }

    void TearDown(const ::benchmark::State& /*unused*/) override {}

    size_t norbits{};
    data::FittedOrbits orbits;
};

BENCHMARK_DEFINE_F(AccumulatorFixture,
                   BM_ipod_accumulate)(benchmark::State& state) {
    for (auto _ : state) {
        state.PauseTiming();
        std::vector<data::ResultBatches> chunks;
        chunks.reserve(nchunks);
        for (size_t i = 0; i < nchunks; ++i) {
            chunks.push_back(make_chunk());
        }
        state.ResumeTiming();
        ResultAccumulator totals;
        for (auto& chunk : chunks) {
            totals.merge(std::move(chunk));
        }
        auto results = totals.take();
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(
        static_cast<size_t>(state.iterations()) * nchunks * kRowsPerChunk));
}

BENCHMARK_DEFINE_F(ManagerFixture, BM_ipod_plan)(benchmark::State& state) {
    for (auto _ : state) {
        const auto chunk_size = effective_chunk_size(norbits, 8, 10);
        auto chunks = ChunkPlanner(norbits, chunk_size).to_vector();
        benchmark::DoNotOptimize(chunks);
    }
}

BENCHMARK_DEFINE_F(ManagerFixture, BM_ipod_run_seq)(benchmark::State& state) {
    const search::IPODConfig cfg(1.0, 10.0, 5.0, 15.0, 3.0, 9.0, 8.0,
                                 std::nullopt, std::nullopt, 10, 1);
    auto refiner = std::make_shared<EchoRefiner>();
    const refine::IndexOpener opener = [](const refine::IndexOptions&) {
        return std::make_unique<NullIndex>();
    };
    for (auto _ : state) {
        auto results = iterative_precovery_and_differential_correction(
            orbits, refiner, opener, std::nullopt, std::nullopt, std::nullopt,
            cfg);
        benchmark::DoNotOptimize(results);
    }
}

BENCHMARK_DEFINE_F(ManagerFixture, BM_ipod_run_par)(benchmark::State& state) {
    const auto max_workers = static_cast<SizeType>(omp_get_max_threads());
    const search::IPODConfig cfg(1.0, 10.0, 5.0, 15.0, 3.0, 9.0, 8.0,
                                 std::nullopt, std::nullopt, 10, max_workers);
    auto refiner = std::make_shared<EchoRefiner>();
    const refine::IndexOpener opener = [](const refine::IndexOptions&) {
        return std::make_unique<NullIndex>();
    };
    for (auto _ : state) {
        auto results = iterative_precovery_and_differential_correction(
            orbits, refiner, opener, std::nullopt, std::nullopt, std::nullopt,
            cfg);
        benchmark::DoNotOptimize(results);
    }
}

constexpr size_t kMinNchunks = 1 << 4;
constexpr size_t kMaxNchunks = 1 << 12;
constexpr size_t kMinNorbits = 1 << 8;
constexpr size_t kMaxNorbits = 1 << 14;

BENCHMARK_REGISTER_F(AccumulatorFixture, BM_ipod_accumulate)
    ->RangeMultiplier(4)
    ->Range(kMinNchunks, kMaxNchunks);

BENCHMARK_REGISTER_F(ManagerFixture, BM_ipod_plan)
    ->RangeMultiplier(4)
    ->Range(kMinNorbits, kMaxNorbits);

BENCHMARK_REGISTER_F(ManagerFixture, BM_ipod_run_seq)
    ->RangeMultiplier(4)
    ->Range(kMinNorbits, kMaxNorbits);

BENCHMARK_REGISTER_F(ManagerFixture, BM_ipod_run_par)
    ->RangeMultiplier(4)
    ->Range(kMinNorbits, kMaxNorbits);

// BENCHMARK_MAIN();

} // namespace ipod::algorithms
