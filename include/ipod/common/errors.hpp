#pragma once

#include <stdexcept>
#include <string>

#include "ipod/common/types.hpp"

namespace ipod {

/**
 * @brief Raised when an orbit identifier does not resolve to exactly one row
 * of the candidate orbit table.
 */
class LookupError : public std::runtime_error {
public:
    LookupError(OrbitID orbit_id, const std::string& what)
        : std::runtime_error(what),
          m_orbit_id(std::move(orbit_id)) {}

    [[nodiscard]] const OrbitID& orbit_id() const noexcept {
        return m_orbit_id;
    }

private:
    OrbitID m_orbit_id;
};

/**
 * @brief Raised when the refinement routine fails for one orbit. Aborts the
 * chunk that contains the orbit and, with it, the whole run.
 */
class RefinementError : public std::runtime_error {
public:
    RefinementError(OrbitID orbit_id, const std::string& what)
        : std::runtime_error(what),
          m_orbit_id(std::move(orbit_id)) {}

    [[nodiscard]] const OrbitID& orbit_id() const noexcept {
        return m_orbit_id;
    }

private:
    OrbitID m_orbit_id;
};

} // namespace ipod
