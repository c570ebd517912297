#include "ipod/io/result_writer.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include <highfive/highfive.hpp>
#include <spdlog/spdlog.h>

#include "ipod/timing.hpp"

namespace ipod::io {

namespace {

constexpr std::string_view kFormatVersion = "1.0.0-cpp";
constexpr SizeType kChunkRows             = 4096;

template <typename Row, typename Getter>
auto extract_column(const data::RecordBatch<Row>& rows, Getter&& get) {
    using Value = std::decay_t<std::invoke_result_t<Getter, const Row&>>;
    std::vector<Value> values;
    values.reserve(rows.size());
    for (const auto& row : rows) {
        values.push_back(get(row));
    }
    return values;
}

template <typename T>
void write_column(HighFive::Group& group,
                  const std::string& name,
                  const std::vector<T>& values) {
    HighFive::DataSetCreateProps props;
    if (!values.empty()) {
        props.add(HighFive::Chunking(std::vector<hsize_t>{
            static_cast<hsize_t>(std::min(values.size(), kChunkRows))}));
        props.add(HighFive::Deflate(9)); // Gzip compression level 9
    }
    group.createDataSet(name, values, props);
}

template <typename Row, typename Getter>
void write_field(HighFive::Group& group,
                 const data::RecordBatch<Row>& rows,
                 const std::string& name,
                 Getter&& get) {
    write_column(group, name, extract_column(rows, std::forward<Getter>(get)));
}

template <typename Row, typename Getter>
void write_flag(HighFive::Group& group,
                const data::RecordBatch<Row>& rows,
                const std::string& name,
                Getter&& get) {
    write_column(group, name, extract_column(rows, [&](const Row& row) {
                     return static_cast<std::uint8_t>(get(row) ? 1 : 0);
                 }));
}

template <typename Row, typename Getter>
void write_time(HighFive::Group& group,
                const data::RecordBatch<Row>& rows,
                const std::string& name,
                Getter&& get) {
    write_column(group, name + "_days", extract_column(rows, [&](const Row& r) {
                     return get(r).days;
                 }));
    write_column(group, name + "_nanos",
                 extract_column(rows, [&](const Row& r) {
                     return get(r).nanos;
                 }));
}

HighFive::Group create_collection(HighFive::Group& run_group,
                                  const std::string& name,
                                  SizeType num_rows) {
    HighFive::Group group = run_group.createGroup(name);
    group.createAttribute("num_rows", num_rows);
    return group;
}

void write_orbits(HighFive::Group& run_group, const data::FittedOrbits& rows) {
    using Row = FittedOrbit;
    auto group = create_collection(run_group, "orbits", rows.size());
    write_field(group, rows, "orbit_id",
                [](const Row& r) { return r.orbit_id; });
    write_field(group, rows, "object_id",
                [](const Row& r) { return r.object_id; });
    write_field(group, rows, "x", [](const Row& r) { return r.x; });
    write_field(group, rows, "y", [](const Row& r) { return r.y; });
    write_field(group, rows, "z", [](const Row& r) { return r.z; });
    write_field(group, rows, "vx", [](const Row& r) { return r.vx; });
    write_field(group, rows, "vy", [](const Row& r) { return r.vy; });
    write_field(group, rows, "vz", [](const Row& r) { return r.vz; });
    write_time(group, rows, "epoch", [](const Row& r) { return r.epoch; });
    write_field(group, rows, "arc_length",
                [](const Row& r) { return r.arc_length; });
    write_field(group, rows, "num_obs", [](const Row& r) { return r.num_obs; });
    write_field(group, rows, "chi2", [](const Row& r) { return r.chi2; });
    write_field(group, rows, "reduced_chi2",
                [](const Row& r) { return r.reduced_chi2; });
    write_field(group, rows, "iterations",
                [](const Row& r) { return r.iterations; });
    write_flag(group, rows, "success", [](const Row& r) { return r.success; });
    write_field(group, rows, "status_code",
                [](const Row& r) { return r.status_code; });
}

void write_members(HighFive::Group& run_group,
                   const data::FittedOrbitMembers& rows) {
    using Row = FittedOrbitMember;
    auto group = create_collection(run_group, "members", rows.size());
    write_field(group, rows, "orbit_id",
                [](const Row& r) { return r.orbit_id; });
    write_field(group, rows, "obs_id", [](const Row& r) { return r.obs_id; });
    write_field(group, rows, "residual_ra",
                [](const Row& r) { return r.residual_ra; });
    write_field(group, rows, "residual_dec",
                [](const Row& r) { return r.residual_dec; });
    write_field(group, rows, "chi2", [](const Row& r) { return r.chi2; });
    write_flag(group, rows, "solution",
                [](const Row& r) { return r.solution; });
    write_flag(group, rows, "outlier", [](const Row& r) { return r.outlier; });
}

void write_candidates(HighFive::Group& run_group,
                      const data::PrecoveryCandidates& rows) {
    using Row = PrecoveryCandidate;
    auto group = create_collection(run_group, "candidates", rows.size());
    write_field(group, rows, "orbit_id",
                [](const Row& r) { return r.orbit_id; });
    write_field(group, rows, "observation_id",
                [](const Row& r) { return r.observation_id; });
    write_field(group, rows, "exposure_id",
                [](const Row& r) { return r.exposure_id; });
    write_field(group, rows, "dataset_id",
                [](const Row& r) { return r.dataset_id; });
    write_time(group, rows, "time", [](const Row& r) { return r.time; });
    write_field(group, rows, "ra", [](const Row& r) { return r.ra; });
    write_field(group, rows, "dec", [](const Row& r) { return r.dec; });
    write_field(group, rows, "sigma_ra",
                [](const Row& r) { return r.sigma_ra; });
    write_field(group, rows, "sigma_dec",
                [](const Row& r) { return r.sigma_dec; });
    write_field(group, rows, "mag", [](const Row& r) { return r.mag; });
    write_field(group, rows, "filter", [](const Row& r) { return r.filter; });
    write_field(group, rows, "observatory_code",
                [](const Row& r) { return r.observatory_code; });
    write_field(group, rows, "pred_ra", [](const Row& r) { return r.pred_ra; });
    write_field(group, rows, "pred_dec",
                [](const Row& r) { return r.pred_dec; });
    write_field(group, rows, "delta_ra_arcsec",
                [](const Row& r) { return r.delta_ra_arcsec; });
    write_field(group, rows, "delta_dec_arcsec",
                [](const Row& r) { return r.delta_dec_arcsec; });
    write_field(group, rows, "distance_arcsec",
                [](const Row& r) { return r.distance_arcsec; });
}

void write_summaries(HighFive::Group& run_group,
                     const data::SearchSummaries& rows) {
    using Row = SearchSummary;
    auto group = create_collection(run_group, "summaries", rows.size());
    write_field(group, rows, "orbit_id",
                [](const Row& r) { return r.orbit_id; });
    write_field(group, rows, "min_mjd", [](const Row& r) { return r.min_mjd; });
    write_field(group, rows, "max_mjd", [](const Row& r) { return r.max_mjd; });
    write_field(group, rows, "num_candidates",
                [](const Row& r) { return r.num_candidates; });
    write_field(group, rows, "num_accepted",
                [](const Row& r) { return r.num_accepted; });
    write_field(group, rows, "num_rejected",
                [](const Row& r) { return r.num_rejected; });
    write_field(group, rows, "arc_length",
                [](const Row& r) { return r.arc_length; });
    write_field(group, rows, "iterations",
                [](const Row& r) { return r.iterations; });
}

SizeType read_num_rows(const HighFive::Group& run_group,
                       const std::string& name) {
    SizeType num_rows{};
    run_group.getGroup(name).getAttribute("num_rows").read(num_rows);
    return num_rows;
}

} // namespace

ResultWriter::ResultWriter(std::filesystem::path filename, Mode mode)
    : m_filepath(std::move(filename)),
      m_mode(mode) {}

void ResultWriter::write_results(const std::string& run_name,
                                 const data::ResultBatches& results) {
    std::lock_guard<std::mutex> lock(m_hdf5_mutex);
    timing::ScopeTimer timer("ResultWriter::write_results");

    HighFive::File::AccessMode open_mode;
    if (m_mode == Mode::kWrite && !m_opened) {
        open_mode = HighFive::File::Overwrite;
    } else if (std::filesystem::exists(m_filepath)) {
        open_mode = HighFive::File::ReadWrite;
    } else {
        open_mode = HighFive::File::Create;
    }
    HighFive::File file(m_filepath.string(), open_mode);
    if (!file.isValid()) {
        throw std::runtime_error("Failed to create valid HDF5 file");
    }
    m_opened = true;
    if (!file.hasAttribute("ipod_version")) {
        file.createAttribute("ipod_version", std::string(kFormatVersion));
    }

    HighFive::Group runs_group =
        file.exist("runs") ? file.getGroup("runs") : file.createGroup("runs");
    if (runs_group.exist(run_name)) {
        throw std::runtime_error(
            std::format("Run name {} already exists.", run_name));
    }
    HighFive::Group run_group = runs_group.createGroup(run_name);
    write_orbits(run_group, results.orbits);
    write_members(run_group, results.members);
    write_candidates(run_group, results.candidates);
    write_summaries(run_group, results.summaries);
    file.flush();
    spdlog::info("Wrote run '{}' ({} orbits) to {}", run_name,
                 results.orbits.size(), m_filepath.string());
}

ResultCounts read_result_counts(const std::filesystem::path& filename,
                                const std::string& run_name) {
    HighFive::File file(filename.string(), HighFive::File::ReadOnly);
    const auto path = std::format("runs/{}", run_name);
    if (!file.exist(path)) {
        throw std::runtime_error(std::format(
            "Run {} not found in {}", run_name, filename.string()));
    }
    const HighFive::Group run_group = file.getGroup(path);
    return ResultCounts{.orbits     = read_num_rows(run_group, "orbits"),
                        .members    = read_num_rows(run_group, "members"),
                        .candidates = read_num_rows(run_group, "candidates"),
                        .summaries  = read_num_rows(run_group, "summaries")};
}

} // namespace ipod::io
