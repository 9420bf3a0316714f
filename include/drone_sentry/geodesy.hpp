// === Geodesy =================================================================
//
// Spherical-earth helpers shared by waypoint arrival checks and the simulated
// vehicle model.

#pragma once

#include "drone_sentry/types.hpp"

namespace drone_sentry {

inline constexpr double k_earth_radius_m{6'371'000.0}; /**< Mean Earth radius used for geodesic calculations. */

/**
 * @brief Determine the great-circle distance separating two coordinates (haversine).
 */
[[nodiscard]] double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to);

/**
 * @brief Compute the initial great-circle bearing from one coordinate to another.
 */
[[nodiscard]] double initial_bearing_deg(const GeodeticCoordinate& from, const GeodeticCoordinate& to);

/**
 * @brief Compute a destination coordinate for a great-circle path. Altitude is preserved.
 */
[[nodiscard]] GeodeticCoordinate advance_coordinate(const GeodeticCoordinate& start, double distance_m, double bearing_deg);

}  // namespace drone_sentry
