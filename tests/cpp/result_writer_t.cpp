#include <filesystem>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include "ipod/io/result_writer.hpp"

#include "mocks.hpp"

using namespace ipod;          // NOLINT
using namespace ipod::testing; // NOLINT

namespace {

data::ResultBatches make_results(SizeType num_orbits) {
    data::ResultBatches results;
    for (SizeType i = 0; i < num_orbits; ++i) {
        const auto orbit_id = orbit_name(i);
        results.orbits.push_back(make_orbit(orbit_id));
        results.summaries.push_back(SearchSummary{.orbit_id = orbit_id});
        for (const auto* suffix : {"_a", "_b"}) {
            results.members.push_back(FittedOrbitMember{
                .orbit_id = orbit_id, .obs_id = orbit_id + suffix});
        }
    }
    results.candidates.push_back(PrecoveryCandidate{
        .orbit_id       = orbit_name(0),
        .observation_id = "c1",
        .time           = Timestamp{.days = 60001, .nanos = 5}});
    return results;
}

class TempFile {
public:
    explicit TempFile(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove(m_path);
    }
    ~TempFile() { std::filesystem::remove(m_path); }
    TempFile(const TempFile&)            = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&&)                 = delete;
    TempFile& operator=(TempFile&&)      = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace

TEST_CASE("ResultWriter", "[io]") {
    const TempFile file("ipod_result_writer_t.h5");

    SECTION("Row counts round trip") {
        io::ResultWriter writer(file.path());
        writer.write_results("run_a", make_results(4));
        const auto counts = io::read_result_counts(file.path(), "run_a");
        REQUIRE(counts.orbits == 4);
        REQUIRE(counts.members == 8);
        REQUIRE(counts.candidates == 1);
        REQUIRE(counts.summaries == 4);
    }
    SECTION("Empty results") {
        io::ResultWriter writer(file.path());
        writer.write_results("empty", data::ResultBatches{});
        const auto counts = io::read_result_counts(file.path(), "empty");
        REQUIRE(counts.orbits == 0);
        REQUIRE(counts.candidates == 0);
    }
    SECTION("Several runs in one file") {
        io::ResultWriter writer(file.path());
        writer.write_results("run_a", make_results(2));
        writer.write_results("run_b", make_results(3));
        REQUIRE(io::read_result_counts(file.path(), "run_a").orbits == 2);
        REQUIRE(io::read_result_counts(file.path(), "run_b").orbits == 3);
        REQUIRE_THROWS_AS(writer.write_results("run_a", make_results(1)),
                          std::runtime_error);
    }
    SECTION("Append keeps earlier runs, write replaces the file") {
        {
            io::ResultWriter writer(file.path());
            writer.write_results("first", make_results(1));
        }
        {
            io::ResultWriter writer(file.path(),
                                    io::ResultWriter::Mode::kAppend);
            writer.write_results("second", make_results(2));
        }
        REQUIRE(io::read_result_counts(file.path(), "first").orbits == 1);
        REQUIRE(io::read_result_counts(file.path(), "second").orbits == 2);
        {
            io::ResultWriter writer(file.path());
            writer.write_results("third", make_results(3));
        }
        REQUIRE_THROWS_AS(io::read_result_counts(file.path(), "first"),
                          std::runtime_error);
    }
    SECTION("Missing run") {
        io::ResultWriter writer(file.path());
        writer.write_results("run_a", make_results(1));
        REQUIRE_THROWS_AS(io::read_result_counts(file.path(), "nope"),
                          std::runtime_error);
    }
}
