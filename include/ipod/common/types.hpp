#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace ipod {

using SizeType  = std::size_t;
using IndexType = std::ptrdiff_t;

// Opaque key of one candidate orbit
using OrbitID = std::string;
// Opaque key of one astrometric observation
using ObsID = std::string;

// Per-dataset astrometric uncertainty override (sigma_ra, sigma_dec) in
// arcseconds
using AstrometricErrors = std::map<std::string, std::pair<double, double>>;
using DatasetSet        = std::set<std::string>;

inline constexpr double kNanosPerDay = 86400.0 * 1e9;

// Load factor of the bounded dispatcher: in-flight tasks per worker
inline constexpr double kInFlightFactor = 1.5;

} // namespace ipod
