#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "ipod/algorithms/dispatcher.hpp"
#include "ipod/common/errors.hpp"

#include "mocks.hpp"

using namespace ipod;          // NOLINT
using namespace ipod::testing; // NOLINT

namespace {

// One orbit row per chunk position
algorithms::BoundedDispatcher::JobFactory make_factory(
    std::optional<SizeType> fail_at = std::nullopt) {
    return [fail_at](const algorithms::ChunkRange& chunk) {
        return runtime::ChunkJob([chunk, fail_at]() {
            data::ResultBatches results;
            for (SizeType i = chunk.start; i < chunk.end; ++i) {
                if (fail_at && i == *fail_at) {
                    throw RefinementError(orbit_name(i), "fit diverged");
                }
                results.orbits.push_back(make_orbit(orbit_name(i)));
            }
            return results;
        });
    };
}

} // namespace

TEST_CASE("max_in_flight", "[dispatcher]") {
    REQUIRE(algorithms::max_in_flight(1) == 2);
    REQUIRE(algorithms::max_in_flight(2) == 3);
    REQUIRE(algorithms::max_in_flight(3) == 5);
    REQUIRE(algorithms::max_in_flight(4) == 6);
    REQUIRE(algorithms::max_in_flight(10) == 15);
    REQUIRE_THROWS_AS(algorithms::max_in_flight(0), std::invalid_argument);
}

TEST_CASE("BoundedDispatcher", "[dispatcher]") {
    SECTION("In-flight window is bounded") {
        for (const auto order :
             {ScriptedRuntime::Order::kFifo, ScriptedRuntime::Order::kLifo}) {
            ScriptedRuntime rt(4, order);
            algorithms::BoundedDispatcher dispatcher(rt, 4);
            const algorithms::ChunkPlanner planner(95, 5);
            algorithms::ResultAccumulator totals;
            dispatcher.dispatch(planner, make_factory(), totals);

            REQUIRE(rt.get_max_outstanding() == 6);
            REQUIRE(dispatcher.get_max_outstanding() == 6);
            REQUIRE(dispatcher.get_num_submitted() == 19);
            REQUIRE(rt.get_outstanding() == 0);
            REQUIRE(totals.get_num_merged() == 19);
            const auto results = totals.take();
            REQUIRE(results.orbits.size() == 95);
            std::vector<OrbitID> expected;
            for (SizeType i = 0; i < 95; ++i) {
                expected.push_back(orbit_name(i));
            }
            REQUIRE(sorted_orbit_ids(results.orbits) == expected);
        }
    }
    SECTION("Fewer chunks than the window") {
        ScriptedRuntime rt(4);
        algorithms::BoundedDispatcher dispatcher(rt, 4);
        const algorithms::ChunkPlanner planner(3, 1);
        algorithms::ResultAccumulator totals;
        dispatcher.dispatch(planner, make_factory(), totals);
        REQUIRE(rt.get_max_outstanding() == 3);
        REQUIRE(totals.take().orbits.size() == 3);
    }
    SECTION("Empty plan submits nothing") {
        ScriptedRuntime rt(2);
        algorithms::BoundedDispatcher dispatcher(rt, 2);
        algorithms::ResultAccumulator totals;
        dispatcher.dispatch(algorithms::ChunkPlanner(0, 0), make_factory(),
                            totals);
        REQUIRE(rt.get_num_submitted() == 0);
        REQUIRE(totals.get_totals().empty());
    }
    SECTION("Merge callback sees chunks in completion order") {
        ScriptedRuntime rt(1, ScriptedRuntime::Order::kLifo);
        algorithms::BoundedDispatcher dispatcher(rt, 1);
        const algorithms::ChunkPlanner planner(4, 1);
        algorithms::ResultAccumulator totals;
        std::vector<SizeType> merged;
        dispatcher.dispatch(planner, make_factory(), totals,
                            [&](const algorithms::ChunkRange& chunk) {
                                merged.push_back(chunk.start);
                            });
        // Window of two: {0,1} -> 1 merged, {0,2} -> 2, {0,3} -> 3, then 0
        REQUIRE(merged == std::vector<SizeType>{1, 2, 3, 0});
    }
    SECTION("Failed chunk aborts the dispatch") {
        ScriptedRuntime rt(1);
        algorithms::BoundedDispatcher dispatcher(rt, 1);
        const algorithms::ChunkPlanner planner(10, 1);
        algorithms::ResultAccumulator totals;
        REQUIRE_THROWS_AS(
            dispatcher.dispatch(planner, make_factory(2), totals),
            RefinementError);
        // Chunks 0 and 1 merged; chunk 2 failed with chunk 3 in flight.
        // Chunk 3 is still waited for and retrieved, but not merged.
        REQUIRE(dispatcher.get_num_submitted() == 4);
        REQUIRE(totals.get_num_merged() == 2);
        REQUIRE(rt.get_num_unfinished() == 0);
        REQUIRE(rt.get_outstanding() == 0);
    }
    SECTION("Abort with a full window drains every task") {
        for (const auto order :
             {ScriptedRuntime::Order::kFifo, ScriptedRuntime::Order::kLifo}) {
            ScriptedRuntime rt(2, order);
            algorithms::BoundedDispatcher dispatcher(rt, 2);
            const algorithms::ChunkPlanner planner(20, 1);
            algorithms::ResultAccumulator totals;
            REQUIRE_THROWS_AS(
                dispatcher.dispatch(planner, make_factory(0), totals),
                RefinementError);
            REQUIRE(rt.get_num_unfinished() == 0);
            REQUIRE(rt.get_outstanding() == 0);
        }
    }
    SECTION("Submit and merge phases alternate") {
        ScriptedRuntime rt(1);
        algorithms::BoundedDispatcher dispatcher(rt, 1);
        const algorithms::ChunkPlanner planner(4, 1);
        algorithms::ResultAccumulator totals;
        std::vector<algorithms::DispatchPhase> phases;
        dispatcher.dispatch(planner, make_factory(), totals, {},
                            [&](algorithms::DispatchPhase phase) {
                                phases.push_back(phase);
                            });
        using enum algorithms::DispatchPhase;
        REQUIRE(phases == std::vector<algorithms::DispatchPhase>{
                              kSubmitting, kSubmitting, kMerging, kSubmitting,
                              kMerging, kSubmitting, kMerging, kMerging});
    }
    SECTION("Invalid arguments") {
        ScriptedRuntime rt(1);
        REQUIRE_THROWS_AS(algorithms::BoundedDispatcher(rt, 0),
                          std::invalid_argument);
        algorithms::BoundedDispatcher dispatcher(rt, 1);
        algorithms::ResultAccumulator totals;
        REQUIRE_THROWS(dispatcher.dispatch(algorithms::ChunkPlanner(2, 1), {},
                                           totals));
    }
}

TEST_CASE("BoundedDispatcher on a thread pool", "[dispatcher]") {
    runtime::ThreadPoolRuntime rt(2);
    algorithms::BoundedDispatcher dispatcher(rt, 2);
    const algorithms::ChunkPlanner planner(12, 1);
    std::atomic<SizeType> num_finished{0};
    const auto make_job = [&num_finished](
                              const algorithms::ChunkRange& chunk) {
        return runtime::ChunkJob([&num_finished, chunk]() {
            if (chunk.start == 0) {
                throw RefinementError(orbit_name(0), "fit diverged");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            data::ResultBatches results;
            results.orbits.push_back(make_orbit(orbit_name(chunk.start)));
            ++num_finished;
            return results;
        });
    };

    SECTION("Abort leaves no task behind") {
        algorithms::ResultAccumulator totals;
        REQUIRE_THROWS_AS(dispatcher.dispatch(planner, make_job, totals),
                          RefinementError);
        // Every other submitted chunk ran to completion before the rethrow
        REQUIRE(rt.num_tasks() == 0);
        REQUIRE(num_finished.load() == dispatcher.get_num_submitted() - 1);
    }
    SECTION("Runtime is reusable after an abort") {
        algorithms::ResultAccumulator failed;
        REQUIRE_THROWS_AS(dispatcher.dispatch(planner, make_job, failed),
                          RefinementError);
        algorithms::ResultAccumulator totals;
        dispatcher.dispatch(algorithms::ChunkPlanner(12, 4), make_factory(),
                            totals);
        REQUIRE(totals.take().orbits.size() == 12);
        REQUIRE(rt.num_tasks() == 0);
    }
}
