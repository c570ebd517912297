#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "ipod/algorithms/accumulator.hpp"

#include "mocks.hpp"

using namespace ipod;          // NOLINT
using namespace ipod::testing; // NOLINT

namespace {

data::ResultBatches make_chunk_results(SizeType start, SizeType count) {
    data::ResultBatches results;
    for (SizeType i = start; i < start + count; ++i) {
        const auto orbit_id = orbit_name(i);
        results.orbits.push_back(make_orbit(orbit_id));
        results.members.push_back(
            FittedOrbitMember{.orbit_id = orbit_id, .obs_id = orbit_id + "_a"});
        results.summaries.push_back(SearchSummary{.orbit_id = orbit_id});
    }
    if (count > 0) {
        results.candidates.push_back(
            PrecoveryCandidate{.orbit_id = orbit_name(start)});
    }
    return results;
}

} // namespace

TEST_CASE("ResultAccumulator", "[accumulator]") {
    SECTION("Starts empty") {
        algorithms::ResultAccumulator totals;
        REQUIRE(totals.get_totals().empty());
        REQUIRE(totals.get_num_merged() == 0);
        REQUIRE(totals.take().empty());
    }
    SECTION("Totals are the concatenation of merged chunks") {
        algorithms::ResultAccumulator totals;
        totals.merge(make_chunk_results(0, 3));
        totals.merge(make_chunk_results(3, 2));
        totals.merge(make_chunk_results(5, 0));
        REQUIRE(totals.get_num_merged() == 3);
        const auto results = totals.take();
        REQUIRE(results.orbits.size() == 5);
        REQUIRE(results.members.size() == 5);
        REQUIRE(results.summaries.size() == 5);
        REQUIRE(results.candidates.size() == 2);
        REQUIRE(results.orbits.num_blocks() == 1);
        REQUIRE(totals.get_totals().empty());
        REQUIRE(totals.get_num_merged() == 0);
    }
    SECTION("Merge order does not change the row multiset") {
        algorithms::ResultAccumulator forward;
        algorithms::ResultAccumulator backward;
        for (SizeType i = 0; i < 8; ++i) {
            forward.merge(make_chunk_results(i * 4, 4));
            backward.merge(make_chunk_results((7 - i) * 4, 4));
        }
        const auto a = forward.take();
        const auto b = backward.take();
        REQUIRE(sorted_orbit_ids(a.orbits) == sorted_orbit_ids(b.orbits));
        REQUIRE(sorted_orbit_ids(a.members) == sorted_orbit_ids(b.members));
        REQUIRE(sorted_orbit_ids(a.candidates) ==
                sorted_orbit_ids(b.candidates));
        REQUIRE(sorted_orbit_ids(a.summaries) ==
                sorted_orbit_ids(b.summaries));
        REQUIRE(a.orbits.size() == 32);
    }
    SECTION("Running totals stay compact") {
        algorithms::ResultAccumulator totals;
        for (SizeType i = 0; i < 256; ++i) {
            totals.merge(make_chunk_results(i, 1));
            REQUIRE_FALSE(totals.get_totals().orbits.fragmented());
        }
        REQUIRE(totals.get_totals().orbits.num_blocks() <= 8);
    }
}
