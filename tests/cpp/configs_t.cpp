#include <optional>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include "ipod/search/configs.hpp"

using ipod::search::IPODConfig;

TEST_CASE("IPODConfig defaults", "[configs]") {
    const IPODConfig cfg;
    REQUIRE(cfg.get_min_tolerance() == 1.0);
    REQUIRE(cfg.get_max_tolerance() == 10.0);
    REQUIRE(cfg.get_tolerance_step() == 5.0);
    REQUIRE(cfg.get_delta_time() == 15.0);
    REQUIRE(cfg.get_rchi2_threshold() == 3.0);
    REQUIRE(cfg.get_outlier_chi2() == 9.0);
    REQUIRE(cfg.get_reconsider_chi2() == 8.0);
    REQUIRE_FALSE(cfg.get_min_mjd().has_value());
    REQUIRE_FALSE(cfg.get_max_mjd().has_value());
    REQUIRE(cfg.get_chunk_size() == 10);
    REQUIRE(cfg.get_max_workers() == 1);
    REQUIRE_FALSE(cfg.get_astrometric_errors().has_value());
    REQUIRE_FALSE(cfg.get_datasets().has_value());
}

TEST_CASE("IPODConfig derived settings", "[configs]") {
    SECTION("Refinement parameters") {
        const IPODConfig cfg(2.0, 20.0, 4.0, 30.0, 2.5, 10.0, 7.0, 59000.0,
                             60000.0, 5, 2, "/data/precovery",
                             ipod::AstrometricErrors{{"NSC", {0.1, 0.2}}},
                             ipod::DatasetSet{"NSC", "SMARTS"});
        const auto params = cfg.get_refinement_params();
        REQUIRE(params.min_tolerance == 2.0);
        REQUIRE(params.max_tolerance == 20.0);
        REQUIRE(params.tolerance_step == 4.0);
        REQUIRE(params.delta_time == 30.0);
        REQUIRE(params.rchi2_threshold == 2.5);
        REQUIRE(params.outlier_chi2 == 10.0);
        REQUIRE(params.reconsider_chi2 == 7.0);
        REQUIRE(params.min_mjd == 59000.0);
        REQUIRE(params.max_mjd == 60000.0);
        REQUIRE(params.astrometric_errors->at("NSC").second == 0.2);
        REQUIRE(params.datasets->size() == 2);
        REQUIRE(params.known_outliers.empty());
    }
    SECTION("Index options open read-only") {
        const IPODConfig cfg(1.0, 10.0, 5.0, 15.0, 3.0, 9.0, 8.0,
                             std::nullopt, std::nullopt, 10, 1,
                             "/data/precovery");
        const auto options = cfg.get_index_options();
        REQUIRE(options.directory.string() == "/data/precovery");
        REQUIRE_FALSE(options.create);
        REQUIRE(options.read_only);
        REQUIRE(options.allow_version_mismatch);
    }
    SECTION("Worker count from the machine") {
        const IPODConfig cfg(1.0, 10.0, 5.0, 15.0, 3.0, 9.0, 8.0,
                             std::nullopt, std::nullopt, 10, std::nullopt);
        REQUIRE(cfg.get_max_workers() >= 1);
    }
}

TEST_CASE("IPODConfig validation", "[configs]") {
    REQUIRE_THROWS_AS(IPODConfig(0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(IPODConfig(5.0, 1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(IPODConfig(1.0, 10.0, 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(IPODConfig(1.0, 10.0, 5.0, -1.0),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(IPODConfig(1.0, 10.0, 5.0, 15.0, 0.0),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(IPODConfig(1.0, 10.0, 5.0, 15.0, 3.0, 9.0, 8.0,
                                 60000.0, 59000.0),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(IPODConfig(1.0, 10.0, 5.0, 15.0, 3.0, 9.0, 8.0,
                                 std::nullopt, std::nullopt, 0),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(IPODConfig(1.0, 10.0, 5.0, 15.0, 3.0, 9.0, 8.0,
                                 std::nullopt, std::nullopt, 10, 0),
                      std::invalid_argument);
}
