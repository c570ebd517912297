#pragma once

#include <filesystem>
#include <optional>

#include "ipod/common/types.hpp"
#include "ipod/refine/refiner.hpp"

namespace ipod::search {

/**
 * @brief Run-level settings of iterative precovery and differential
 * correction.
 *
 * Refinement parameters are passed through to the refinement routine
 * unchanged; chunk_size and max_workers drive the orchestration.
 */
class IPODConfig {
public:
    IPODConfig(double min_tolerance                = 1.0,
               double max_tolerance                = 10.0,
               double tolerance_step               = 5.0,
               double delta_time                   = 15.0,
               double rchi2_threshold              = 3.0,
               double outlier_chi2                 = 9.0,
               double reconsider_chi2              = 8.0,
               std::optional<double> min_mjd       = std::nullopt,
               std::optional<double> max_mjd       = std::nullopt,
               SizeType chunk_size                 = 10,
               std::optional<SizeType> max_workers = 1,
               std::filesystem::path database_directory = {},
               std::optional<AstrometricErrors> astrometric_errors =
                   std::nullopt,
               std::optional<DatasetSet> datasets = std::nullopt);

    // Getters
    [[nodiscard]] double get_min_tolerance() const { return m_min_tolerance; }
    [[nodiscard]] double get_max_tolerance() const { return m_max_tolerance; }
    [[nodiscard]] double get_tolerance_step() const {
        return m_tolerance_step;
    }
    [[nodiscard]] double get_delta_time() const { return m_delta_time; }
    [[nodiscard]] double get_rchi2_threshold() const {
        return m_rchi2_threshold;
    }
    [[nodiscard]] double get_outlier_chi2() const { return m_outlier_chi2; }
    [[nodiscard]] double get_reconsider_chi2() const {
        return m_reconsider_chi2;
    }
    [[nodiscard]] std::optional<double> get_min_mjd() const {
        return m_min_mjd;
    }
    [[nodiscard]] std::optional<double> get_max_mjd() const {
        return m_max_mjd;
    }
    [[nodiscard]] SizeType get_chunk_size() const { return m_chunk_size; }
    [[nodiscard]] SizeType get_max_workers() const { return m_max_workers; }
    [[nodiscard]] const std::filesystem::path& get_database_directory() const {
        return m_database_directory;
    }
    [[nodiscard]] const std::optional<AstrometricErrors>&
    get_astrometric_errors() const {
        return m_astrometric_errors;
    }
    [[nodiscard]] const std::optional<DatasetSet>& get_datasets() const {
        return m_datasets;
    }

    // Refinement parameters shared by every orbit of the run
    [[nodiscard]] refine::RefinementParams get_refinement_params() const;
    // Options used by each worker to open its precovery index handle
    [[nodiscard]] refine::IndexOptions get_index_options() const;

private:
    void validate() const;

    double m_min_tolerance;
    double m_max_tolerance;
    double m_tolerance_step;
    double m_delta_time;
    double m_rchi2_threshold;
    double m_outlier_chi2;
    double m_reconsider_chi2;
    std::optional<double> m_min_mjd;
    std::optional<double> m_max_mjd;
    SizeType m_chunk_size;
    SizeType m_max_workers{};
    std::filesystem::path m_database_directory;
    std::optional<AstrometricErrors> m_astrometric_errors;
    std::optional<DatasetSet> m_datasets;
};

} // namespace ipod::search
