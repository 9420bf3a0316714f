// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs used throughout the
// mission core (time primitives, geodetic coordinates, waypoints).

#pragma once

#include <chrono>
#include <optional>

namespace drone_sentry {

/**
 * @brief Alias for the steady clock used for loop pacing and timeouts.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Wall clock used for persisted timestamps and command freshness.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Represents a latitude/longitude/altitude triplet in degrees/metres.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
    double altitude_m{};     /**< Altitude in metres relative to home. */
};

/**
 * @brief Patrol waypoint. Altitude falls back to the mission default when unset.
 */
struct Waypoint final {
    double latitude_deg{};                /**< Latitude in decimal degrees. */
    double longitude_deg{};               /**< Longitude in decimal degrees. */
    std::optional<double> altitude_m{};   /**< Optional altitude override in metres. */

    [[nodiscard]] GeodeticCoordinate resolve(double default_altitude_m) const noexcept {
        return GeodeticCoordinate{latitude_deg, longitude_deg, altitude_m.value_or(default_altitude_m)};
    }

    friend bool operator==(const Waypoint&, const Waypoint&) = default;
};

/**
 * @brief Convert a seconds-based duration into the steady clock's native unit.
 */
inline SteadyClock::duration to_steady(Duration duration) {
    return std::chrono::duration_cast<SteadyClock::duration>(duration);
}

}  // namespace drone_sentry
