#include "ipod/refine/refiner.hpp"

#include <exception>
#include <format>

#include <spdlog/spdlog.h>

#include "ipod/exceptions.hpp"

namespace ipod::refine {

IndexHandle::IndexHandle(const IndexOpener& opener,
                         const IndexOptions& options) {
    error_check::check(static_cast<bool>(opener),
                       "IndexHandle: no precovery index opener supplied");
    m_index = opener(options);
    error_check::check_not_null(
        m_index.get(), std::format("IndexHandle: opener returned no index for "
                                   "'{}'",
                                   options.directory.string()));
}

IndexHandle::~IndexHandle() {
    if (m_closed || !m_index) {
        return;
    }
    try {
        close();
    } catch (const std::exception& e) {
        spdlog::error("Failed to close precovery index: {}", e.what());
    }
}

PrecoveryIndex& IndexHandle::get() {
    error_check::check(!m_closed, "IndexHandle: index is already closed");
    return *m_index;
}

void IndexHandle::close() {
    if (m_closed) {
        return;
    }
    m_closed = true;
    m_index->close();
}

} // namespace ipod::refine
