#include "ipod/search/configs.hpp"

#include <algorithm>
#include <format>
#include <omp.h>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace ipod::search {

IPODConfig::IPODConfig(double min_tolerance,
                       double max_tolerance,
                       double tolerance_step,
                       double delta_time,
                       double rchi2_threshold,
                       double outlier_chi2,
                       double reconsider_chi2,
                       std::optional<double> min_mjd,
                       std::optional<double> max_mjd,
                       SizeType chunk_size,
                       std::optional<SizeType> max_workers,
                       std::filesystem::path database_directory,
                       std::optional<AstrometricErrors> astrometric_errors,
                       std::optional<DatasetSet> datasets)
    : m_min_tolerance(min_tolerance),
      m_max_tolerance(max_tolerance),
      m_tolerance_step(tolerance_step),
      m_delta_time(delta_time),
      m_rchi2_threshold(rchi2_threshold),
      m_outlier_chi2(outlier_chi2),
      m_reconsider_chi2(reconsider_chi2),
      m_min_mjd(min_mjd),
      m_max_mjd(max_mjd),
      m_chunk_size(chunk_size),
      m_database_directory(std::move(database_directory)),
      m_astrometric_errors(std::move(astrometric_errors)),
      m_datasets(std::move(datasets)) {
    m_max_workers = max_workers.value_or(
        static_cast<SizeType>(std::max(omp_get_max_threads(), 1)));
    validate();

    spdlog::info(
        "IPODConfigClass: min_tolerance={}, max_tolerance={}, "
        "tolerance_step={}, delta_time={}, rchi2_threshold={}, "
        "outlier_chi2={}, reconsider_chi2={}, min_mjd={}, max_mjd={}, "
        "chunk_size={}, max_workers={}, database_directory={}",
        m_min_tolerance, m_max_tolerance, m_tolerance_step, m_delta_time,
        m_rchi2_threshold, m_outlier_chi2, m_reconsider_chi2,
        m_min_mjd ? std::format("{}", *m_min_mjd) : std::string("None"),
        m_max_mjd ? std::format("{}", *m_max_mjd) : std::string("None"),
        m_chunk_size, m_max_workers, m_database_directory.string());
}

refine::RefinementParams IPODConfig::get_refinement_params() const {
    refine::RefinementParams params;
    params.min_tolerance      = m_min_tolerance;
    params.max_tolerance      = m_max_tolerance;
    params.tolerance_step     = m_tolerance_step;
    params.delta_time         = m_delta_time;
    params.rchi2_threshold    = m_rchi2_threshold;
    params.outlier_chi2       = m_outlier_chi2;
    params.reconsider_chi2    = m_reconsider_chi2;
    params.min_mjd            = m_min_mjd;
    params.max_mjd            = m_max_mjd;
    params.astrometric_errors = m_astrometric_errors;
    params.datasets           = m_datasets;
    return params;
}

refine::IndexOptions IPODConfig::get_index_options() const {
    return refine::IndexOptions{.directory              = m_database_directory,
                                .create                 = false,
                                .read_only              = true,
                                .allow_version_mismatch = true};
}

void IPODConfig::validate() const {
    if (m_min_tolerance <= 0) {
        throw std::invalid_argument(std::format(
            "min_tolerance must be positive (got {})", m_min_tolerance));
    }
    if (m_max_tolerance < m_min_tolerance) {
        throw std::invalid_argument(
            std::format("max_tolerance must be at least min_tolerance (got "
                        "{} < {})",
                        m_max_tolerance, m_min_tolerance));
    }
    if (m_tolerance_step <= 0) {
        throw std::invalid_argument(std::format(
            "tolerance_step must be positive (got {})", m_tolerance_step));
    }
    if (m_delta_time < 0) {
        throw std::invalid_argument(std::format(
            "delta_time must be non-negative (got {})", m_delta_time));
    }
    if (m_rchi2_threshold <= 0) {
        throw std::invalid_argument(std::format(
            "rchi2_threshold must be positive (got {})", m_rchi2_threshold));
    }
    if (m_outlier_chi2 <= 0) {
        throw std::invalid_argument(std::format(
            "outlier_chi2 must be positive (got {})", m_outlier_chi2));
    }
    if (m_reconsider_chi2 <= 0) {
        throw std::invalid_argument(std::format(
            "reconsider_chi2 must be positive (got {})", m_reconsider_chi2));
    }
    if (m_min_mjd && m_max_mjd && *m_min_mjd > *m_max_mjd) {
        throw std::invalid_argument(
            std::format("min_mjd must not exceed max_mjd (got {} > {})",
                        *m_min_mjd, *m_max_mjd));
    }
    if (m_chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be at least 1");
    }
    if (m_max_workers == 0) {
        throw std::invalid_argument("max_workers must be at least 1");
    }
}

} // namespace ipod::search
