#pragma once

#include <memory>
#include <utility>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "ipod/data/record_batch.hpp"

namespace py = pybind11;

/**
 * @brief Python object that may be released from a thread not holding the
 * GIL.
 *
 * Shared by the worker threads of a run; the last owner takes the GIL to
 * drop the reference.
 */
class GilSafeObject {
public:
    explicit GilSafeObject(py::object obj) : m_obj(std::move(obj)) {}
    ~GilSafeObject() {
        py::gil_scoped_acquire gil;
        m_obj = py::object();
    }
    GilSafeObject(const GilSafeObject&)            = delete;
    GilSafeObject& operator=(const GilSafeObject&) = delete;
    GilSafeObject(GilSafeObject&&)                 = delete;
    GilSafeObject& operator=(GilSafeObject&&)      = delete;

    // Caller must hold the GIL
    [[nodiscard]] const py::object& get() const noexcept { return m_obj; }

private:
    py::object m_obj;
};

// Rows of a batch as a Python list
template <typename Row>
inline py::list as_pylist(const ipod::data::RecordBatch<Row>& batch) {
    py::list result;
    for (const auto& row : batch) {
        result.append(py::cast(row));
    }
    return result;
}

template <typename Row>
inline ipod::data::RecordBatch<Row> to_batch(std::vector<Row> rows) {
    return ipod::data::RecordBatch<Row>(std::move(rows));
}
