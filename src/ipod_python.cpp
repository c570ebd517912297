#include "pybind_utils.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <pybind11/iostream.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>

#include "ipod/ipod.hpp"

namespace ipod {
using algorithms::effective_chunk_size;
using data::ResultBatches;
using refine::IndexOptions;
using refine::RefinementParams;
using search::IPODConfig;

namespace py = pybind11;

namespace {

// Precovery index handle implemented by a Python object
class PythonIndex final : public refine::PrecoveryIndex {
public:
    explicit PythonIndex(py::object obj)
        : m_obj(std::make_shared<GilSafeObject>(std::move(obj))) {}

    void close() override {
        py::gil_scoped_acquire gil;
        if (!py::hasattr(m_obj->get(), "close")) {
            return;
        }
        try {
            m_obj->get().attr("close")();
        } catch (py::error_already_set& e) {
            throw std::runtime_error(e.what());
        }
    }

    // Caller must hold the GIL
    [[nodiscard]] py::object object() const { return m_obj->get(); }

private:
    std::shared_ptr<GilSafeObject> m_obj;
};

// Refinement routine implemented by a Python callable
class PythonRefiner final : public refine::Refiner {
public:
    explicit PythonRefiner(py::function fn)
        : m_fn(std::make_shared<GilSafeObject>(std::move(fn))) {}

    refine::RefinementResult
    refine(const FittedOrbit& candidate,
           const std::optional<OrbitDeterminationObservations>& observations,
           refine::PrecoveryIndex& index,
           const RefinementParams& params) override {
        py::gil_scoped_acquire gil;
        py::object py_index = py::none();
        if (const auto* handle = dynamic_cast<const PythonIndex*>(&index)) {
            py_index = handle->object();
        }
        try {
            const py::object result =
                m_fn->get()(candidate, observations, py_index, params);
            return result.cast<ResultBatches>();
        } catch (py::error_already_set& e) {
            throw std::runtime_error(e.what());
        }
    }

private:
    std::shared_ptr<GilSafeObject> m_fn;
};

refine::IndexOpener make_index_opener(const py::function& index_opener) {
    auto opener = std::make_shared<GilSafeObject>(index_opener);
    return [opener](const IndexOptions& options)
               -> std::unique_ptr<refine::PrecoveryIndex> {
        py::gil_scoped_acquire gil;
        try {
            return std::make_unique<PythonIndex>(opener->get()(options));
        } catch (py::error_already_set& e) {
            throw std::runtime_error(e.what());
        }
    };
}

} // namespace

PYBIND11_MODULE(libipod, m) {
    m.doc() = "Python bindings for the ipod library";

    py::add_ostream_redirect(m, "ostream_redirect");
    py::register_exception<RefinementError>(m, "RefinementError",
                                            PyExc_RuntimeError);
    py::register_exception<LookupError>(m, "OrbitLookupError",
                                        PyExc_LookupError);

    auto m_records = m.def_submodule("records", "Row types submodule");
    py::class_<Timestamp>(m_records, "Timestamp")
        .def(py::init<>())
        .def(py::init([](std::int64_t days, std::int64_t nanos) {
                 return Timestamp{.days = days, .nanos = nanos};
             }),
             py::arg("days"), py::arg("nanos") = 0)
        .def_readwrite("days", &Timestamp::days)
        .def_readwrite("nanos", &Timestamp::nanos)
        .def_property_readonly("mjd", &Timestamp::mjd);

    py::class_<FittedOrbit>(m_records, "FittedOrbit")
        .def(py::init<>())
        .def_readwrite("orbit_id", &FittedOrbit::orbit_id)
        .def_readwrite("object_id", &FittedOrbit::object_id)
        .def_readwrite("x", &FittedOrbit::x)
        .def_readwrite("y", &FittedOrbit::y)
        .def_readwrite("z", &FittedOrbit::z)
        .def_readwrite("vx", &FittedOrbit::vx)
        .def_readwrite("vy", &FittedOrbit::vy)
        .def_readwrite("vz", &FittedOrbit::vz)
        .def_readwrite("epoch", &FittedOrbit::epoch)
        .def_readwrite("arc_length", &FittedOrbit::arc_length)
        .def_readwrite("num_obs", &FittedOrbit::num_obs)
        .def_readwrite("chi2", &FittedOrbit::chi2)
        .def_readwrite("reduced_chi2", &FittedOrbit::reduced_chi2)
        .def_readwrite("iterations", &FittedOrbit::iterations)
        .def_readwrite("success", &FittedOrbit::success)
        .def_readwrite("status_code", &FittedOrbit::status_code);

    py::class_<FittedOrbitMember>(m_records, "FittedOrbitMember")
        .def(py::init<>())
        .def_readwrite("orbit_id", &FittedOrbitMember::orbit_id)
        .def_readwrite("obs_id", &FittedOrbitMember::obs_id)
        .def_readwrite("residual_ra", &FittedOrbitMember::residual_ra)
        .def_readwrite("residual_dec", &FittedOrbitMember::residual_dec)
        .def_readwrite("chi2", &FittedOrbitMember::chi2)
        .def_readwrite("solution", &FittedOrbitMember::solution)
        .def_readwrite("outlier", &FittedOrbitMember::outlier);

    py::class_<Observation>(m_records, "Observation")
        .def(py::init<>())
        .def_readwrite("id", &Observation::id)
        .def_readwrite("exposure_id", &Observation::exposure_id)
        .def_readwrite("time", &Observation::time)
        .def_readwrite("ra", &Observation::ra)
        .def_readwrite("dec", &Observation::dec)
        .def_readwrite("sigma_ra", &Observation::sigma_ra)
        .def_readwrite("sigma_dec", &Observation::sigma_dec)
        .def_readwrite("mag", &Observation::mag)
        .def_readwrite("observatory_code", &Observation::observatory_code);

    py::class_<Observer>(m_records, "Observer")
        .def(py::init<>())
        .def_readwrite("code", &Observer::code)
        .def_readwrite("time", &Observer::time);

    py::class_<OrbitDeterminationObservations>(m_records,
                                               "OrbitDeterminationObservations")
        .def_readonly("ids", &OrbitDeterminationObservations::ids)
        .def_readonly("observations",
                      &OrbitDeterminationObservations::observations)
        .def_readonly("observers", &OrbitDeterminationObservations::observers)
        .def("__len__", &OrbitDeterminationObservations::size);

    py::class_<PrecoveryCandidate>(m_records, "PrecoveryCandidate")
        .def(py::init<>())
        .def_readwrite("orbit_id", &PrecoveryCandidate::orbit_id)
        .def_readwrite("observation_id", &PrecoveryCandidate::observation_id)
        .def_readwrite("exposure_id", &PrecoveryCandidate::exposure_id)
        .def_readwrite("dataset_id", &PrecoveryCandidate::dataset_id)
        .def_readwrite("time", &PrecoveryCandidate::time)
        .def_readwrite("ra", &PrecoveryCandidate::ra)
        .def_readwrite("dec", &PrecoveryCandidate::dec)
        .def_readwrite("sigma_ra", &PrecoveryCandidate::sigma_ra)
        .def_readwrite("sigma_dec", &PrecoveryCandidate::sigma_dec)
        .def_readwrite("mag", &PrecoveryCandidate::mag)
        .def_readwrite("filter", &PrecoveryCandidate::filter)
        .def_readwrite("observatory_code",
                       &PrecoveryCandidate::observatory_code)
        .def_readwrite("pred_ra", &PrecoveryCandidate::pred_ra)
        .def_readwrite("pred_dec", &PrecoveryCandidate::pred_dec)
        .def_readwrite("delta_ra_arcsec", &PrecoveryCandidate::delta_ra_arcsec)
        .def_readwrite("delta_dec_arcsec",
                       &PrecoveryCandidate::delta_dec_arcsec)
        .def_readwrite("distance_arcsec", &PrecoveryCandidate::distance_arcsec);

    py::class_<SearchSummary>(m_records, "SearchSummary")
        .def(py::init<>())
        .def_readwrite("orbit_id", &SearchSummary::orbit_id)
        .def_readwrite("min_mjd", &SearchSummary::min_mjd)
        .def_readwrite("max_mjd", &SearchSummary::max_mjd)
        .def_readwrite("num_candidates", &SearchSummary::num_candidates)
        .def_readwrite("num_accepted", &SearchSummary::num_accepted)
        .def_readwrite("num_rejected", &SearchSummary::num_rejected)
        .def_readwrite("arc_length", &SearchSummary::arc_length)
        .def_readwrite("iterations", &SearchSummary::iterations);

    py::class_<OrbitOutlier>(m_records, "OrbitOutlier")
        .def(py::init([](OrbitID orbit_id, ObsID obs_id) {
                 return OrbitOutlier{.orbit_id = std::move(orbit_id),
                                     .obs_id   = std::move(obs_id)};
             }),
             py::arg("orbit_id"), py::arg("obs_id"))
        .def_readwrite("orbit_id", &OrbitOutlier::orbit_id)
        .def_readwrite("obs_id", &OrbitOutlier::obs_id);

    py::class_<ResultBatches>(m_records, "ResultBatches")
        .def(py::init([](std::vector<FittedOrbit> orbits,
                         std::vector<FittedOrbitMember> members,
                         std::vector<PrecoveryCandidate> candidates,
                         std::vector<SearchSummary> summaries) {
                 return ResultBatches{
                     .orbits     = to_batch(std::move(orbits)),
                     .members    = to_batch(std::move(members)),
                     .candidates = to_batch(std::move(candidates)),
                     .summaries  = to_batch(std::move(summaries))};
             }),
             py::arg("orbits")     = std::vector<FittedOrbit>{},
             py::arg("members")    = std::vector<FittedOrbitMember>{},
             py::arg("candidates") = std::vector<PrecoveryCandidate>{},
             py::arg("summaries")  = std::vector<SearchSummary>{})
        .def_property_readonly(
            "orbits", [](const ResultBatches& r) { return as_pylist(r.orbits); })
        .def_property_readonly(
            "members",
            [](const ResultBatches& r) { return as_pylist(r.members); })
        .def_property_readonly(
            "candidates",
            [](const ResultBatches& r) { return as_pylist(r.candidates); })
        .def_property_readonly(
            "summaries",
            [](const ResultBatches& r) { return as_pylist(r.summaries); });

    auto m_configs = m.def_submodule("configs", "Configs submodule");
    py::class_<IndexOptions>(m_configs, "IndexOptions")
        .def_readonly("directory", &IndexOptions::directory)
        .def_readonly("create", &IndexOptions::create)
        .def_readonly("read_only", &IndexOptions::read_only)
        .def_readonly("allow_version_mismatch",
                      &IndexOptions::allow_version_mismatch);

    py::class_<RefinementParams>(m_configs, "RefinementParams")
        .def_readonly("min_tolerance", &RefinementParams::min_tolerance)
        .def_readonly("max_tolerance", &RefinementParams::max_tolerance)
        .def_readonly("tolerance_step", &RefinementParams::tolerance_step)
        .def_readonly("delta_time", &RefinementParams::delta_time)
        .def_readonly("rchi2_threshold", &RefinementParams::rchi2_threshold)
        .def_readonly("outlier_chi2", &RefinementParams::outlier_chi2)
        .def_readonly("reconsider_chi2", &RefinementParams::reconsider_chi2)
        .def_readonly("min_mjd", &RefinementParams::min_mjd)
        .def_readonly("max_mjd", &RefinementParams::max_mjd)
        .def_readonly("astrometric_errors",
                      &RefinementParams::astrometric_errors)
        .def_readonly("datasets", &RefinementParams::datasets)
        .def_readonly("known_outliers", &RefinementParams::known_outliers);

    py::class_<IPODConfig>(m_configs, "IPODConfig")
        .def(py::init<double, double, double, double, double, double, double,
                      std::optional<double>, std::optional<double>, SizeType,
                      std::optional<SizeType>, std::filesystem::path,
                      std::optional<AstrometricErrors>,
                      std::optional<DatasetSet>>(),
             py::arg("min_tolerance") = 1.0, py::arg("max_tolerance") = 10.0,
             py::arg("tolerance_step") = 5.0, py::arg("delta_time") = 15.0,
             py::arg("rchi2_threshold") = 3.0, py::arg("outlier_chi2") = 9.0,
             py::arg("reconsider_chi2")    = 8.0,
             py::arg("min_mjd")            = std::nullopt,
             py::arg("max_mjd")            = std::nullopt,
             py::arg("chunk_size")         = 10,
             py::arg("max_workers")        = 1,
             py::arg("database_directory") = std::filesystem::path{},
             py::arg("astrometric_errors") = std::nullopt,
             py::arg("datasets")           = std::nullopt)
        .def_property_readonly("min_tolerance", &IPODConfig::get_min_tolerance)
        .def_property_readonly("max_tolerance", &IPODConfig::get_max_tolerance)
        .def_property_readonly("tolerance_step",
                               &IPODConfig::get_tolerance_step)
        .def_property_readonly("delta_time", &IPODConfig::get_delta_time)
        .def_property_readonly("rchi2_threshold",
                               &IPODConfig::get_rchi2_threshold)
        .def_property_readonly("outlier_chi2", &IPODConfig::get_outlier_chi2)
        .def_property_readonly("reconsider_chi2",
                               &IPODConfig::get_reconsider_chi2)
        .def_property_readonly("min_mjd", &IPODConfig::get_min_mjd)
        .def_property_readonly("max_mjd", &IPODConfig::get_max_mjd)
        .def_property_readonly("chunk_size", &IPODConfig::get_chunk_size)
        .def_property_readonly("max_workers", &IPODConfig::get_max_workers)
        .def_property_readonly("database_directory",
                               &IPODConfig::get_database_directory)
        .def_property_readonly("astrometric_errors",
                               &IPODConfig::get_astrometric_errors)
        .def_property_readonly("datasets", &IPODConfig::get_datasets);

    m.def("effective_chunk_size", &effective_chunk_size, py::arg("num_items"),
          py::arg("max_workers"), py::arg("chunk_size"));

    m.def(
        "iterative_precovery_and_differential_correction",
        [](std::vector<FittedOrbit> orbits, const py::function& refiner,
           const py::function& index_opener,
           std::optional<std::vector<FittedOrbitMember>> orbit_members,
           std::optional<std::vector<Observation>> observations,
           std::optional<std::vector<OrbitOutlier>> orbit_outliers,
           const std::optional<IPODConfig>& config, bool show_progress) {
            auto refiner_impl = std::make_shared<PythonRefiner>(refiner);
            auto opener       = make_index_opener(index_opener);
            std::optional<data::FittedOrbitMembers> members_batch;
            if (orbit_members) {
                members_batch = to_batch(std::move(*orbit_members));
            }
            std::optional<data::Observations> observations_batch;
            if (observations) {
                observations_batch = to_batch(std::move(*observations));
            }
            std::optional<data::OrbitOutliers> outliers_batch;
            if (orbit_outliers) {
                outliers_batch = to_batch(std::move(*orbit_outliers));
            }

            const auto cfg = config.value_or(IPODConfig());

            py::gil_scoped_release release;
            return algorithms::iterative_precovery_and_differential_correction(
                to_batch(std::move(orbits)), std::move(refiner_impl),
                std::move(opener), std::move(members_batch),
                std::move(observations_batch), std::move(outliers_batch),
                cfg, /*runtime=*/nullptr, show_progress);
        },
        py::arg("orbits"), py::arg("refiner"), py::arg("index_opener"),
        py::arg("orbit_members") = std::nullopt,
        py::arg("observations")  = std::nullopt,
        py::arg("orbit_outliers") = std::nullopt,
        py::arg("config")        = std::nullopt,
        py::arg("show_progress") = false);

    auto m_io = m.def_submodule("io", "HDF5 results submodule");
    m_io.def(
        "write_results",
        [](const std::filesystem::path& filename, const std::string& run_name,
           const ResultBatches& results, bool append) {
            io::ResultWriter writer(filename,
                                    append ? io::ResultWriter::Mode::kAppend
                                           : io::ResultWriter::Mode::kWrite);
            writer.write_results(run_name, results);
        },
        py::arg("filename"), py::arg("run_name"), py::arg("results"),
        py::arg("append") = false);
    m_io.def(
        "read_result_counts",
        [](const std::filesystem::path& filename, const std::string& run_name) {
            const auto counts = io::read_result_counts(filename, run_name);
            py::dict result;
            result["orbits"]     = counts.orbits;
            result["members"]    = counts.members;
            result["candidates"] = counts.candidates;
            result["summaries"]  = counts.summaries;
            return result;
        },
        py::arg("filename"), py::arg("run_name"));
}

} // namespace ipod
