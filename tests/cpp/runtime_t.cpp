#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "ipod/common/errors.hpp"
#include "ipod/runtime/runtime.hpp"

#include "mocks.hpp"

using namespace ipod;          // NOLINT
using namespace ipod::testing; // NOLINT

namespace {

runtime::ChunkJob make_job(const OrbitID& orbit_id) {
    return [orbit_id]() {
        data::ResultBatches results;
        results.orbits.push_back(make_orbit(orbit_id));
        return results;
    };
}

} // namespace

TEST_CASE("ThreadPoolRuntime", "[runtime]") {
    SECTION("Submit and get") {
        runtime::ThreadPoolRuntime rt(2);
        REQUIRE(rt.num_workers() == 2);
        const auto id     = rt.submit(make_job("orbit_a"));
        const auto result = rt.get(id);
        REQUIRE(result.orbits.size() == 1);
        REQUIRE(result.orbits[0].orbit_id == "orbit_a");
        REQUIRE(rt.num_tasks() == 0);
        REQUIRE_THROWS_AS(rt.get(id), std::out_of_range);
    }
    SECTION("Job exceptions are rethrown by get") {
        runtime::ThreadPoolRuntime rt(1);
        const auto id = rt.submit([]() -> data::ResultBatches {
            throw RefinementError("orbit_x", "fit diverged");
        });
        REQUIRE_THROWS_AS(rt.get(id), RefinementError);
    }
    SECTION("Wait returns the requested number of completions") {
        runtime::ThreadPoolRuntime rt(4);
        std::vector<runtime::TaskId> pending;
        for (SizeType i = 0; i < 8; ++i) {
            pending.push_back(rt.submit(make_job(orbit_name(i))));
        }
        const auto first = rt.wait(pending, 3);
        REQUIRE(first.ready.size() == 3);
        REQUIRE(first.remaining.size() == 5);
        const auto all = rt.wait(pending, pending.size());
        REQUIRE(all.ready.size() == 8);
        REQUIRE(all.remaining.empty());
        SizeType num_orbits = 0;
        for (const auto id : pending) {
            num_orbits += rt.get(id).orbits.size();
        }
        REQUIRE(num_orbits == 8);
    }
    SECTION("Wait reports completion order") {
        runtime::ThreadPoolRuntime rt(2);
        std::promise<void> gate;
        auto gate_future = gate.get_future().share();
        const auto slow  = rt.submit([gate_future]() {
            gate_future.wait();
            return data::ResultBatches{};
        });
        const auto fast  = rt.submit(make_job("fast"));
        const std::vector<runtime::TaskId> pending = {slow, fast};
        const auto result = rt.wait(pending, 1);
        REQUIRE(result.ready == std::vector<runtime::TaskId>{fast});
        REQUIRE(result.remaining == std::vector<runtime::TaskId>{slow});
        gate.set_value();
        REQUIRE(rt.get(slow).empty());
        REQUIRE(rt.get(fast).orbits.size() == 1);
    }
    SECTION("Unknown task ids") {
        runtime::ThreadPoolRuntime rt(1);
        const std::vector<runtime::TaskId> pending = {123};
        REQUIRE_THROWS_AS(rt.wait(pending, 1), std::out_of_range);
    }
    SECTION("Invalid construction and submission") {
        REQUIRE_THROWS(runtime::ThreadPoolRuntime(0));
        runtime::ThreadPoolRuntime rt(1);
        REQUIRE_THROWS(rt.submit(runtime::ChunkJob()));
    }
    SECTION("Unretrieved jobs finish before destruction") {
        auto counter = std::make_shared<std::atomic<int>>(0);
        {
            runtime::ThreadPoolRuntime rt(2);
            for (int i = 0; i < 6; ++i) {
                (void)rt.submit([counter]() {
                    ++(*counter);
                    return data::ResultBatches{};
                });
            }
        }
        REQUIRE(counter->load() == 6);
    }
}

TEST_CASE("ScriptedRuntime completion order", "[runtime]") {
    ScriptedRuntime rt(2, ScriptedRuntime::Order::kLifo);
    std::vector<runtime::TaskId> pending;
    for (SizeType i = 0; i < 3; ++i) {
        pending.push_back(rt.submit(make_job(orbit_name(i))));
    }
    const auto result = rt.wait(pending, 1);
    REQUIRE(result.ready == std::vector<runtime::TaskId>{pending.back()});
    REQUIRE(rt.get(pending.back()).orbits[0].orbit_id == orbit_name(2));
    REQUIRE(rt.get_max_outstanding() == 3);
    REQUIRE(rt.get_outstanding() == 2);
}
