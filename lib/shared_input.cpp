#include "ipod/runtime/shared_input.hpp"

#include <spdlog/spdlog.h>

namespace ipod::runtime {

Broadcaster::~Broadcaster() { release(); }

SizeType Broadcaster::release() {
    if (m_owned.empty()) {
        return 0;
    }
    const auto removed = m_store.free(m_owned);
    spdlog::info("Removed {} references from the object store.",
                 m_owned.size());
    m_owned.clear();
    return removed;
}

} // namespace ipod::runtime
