#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "drone_sentry/types.hpp"

namespace drone_sentry {

/**
 * @brief Captures the observable state of the vehicle as reported by the flight controller.
 */
struct TelemetryState final {
    double latitude_deg{};          /**< Latitude in decimal degrees. */
    double longitude_deg{};         /**< Longitude in decimal degrees. */
    double altitude_msl_m{};        /**< Altitude above mean sea level. */
    double altitude_rel_m{};        /**< Altitude above home/takeoff. */

    double roll_deg{};
    double pitch_deg{};
    double yaw_deg{};               /**< Heading in degrees. */

    double velocity_north_mps{};
    double velocity_east_mps{};
    double velocity_down_mps{};     /**< Positive when descending. */
    double groundspeed_mps{};

    int battery_percent{-1};        /**< 0-100, -1 when unknown. */
    double battery_voltage_v{};
    bool armed{false};
    std::string mode{};             /**< Copter mode name, empty when unrecognised. */
    int gps_fix_type{0};            /**< 0 no fix, 2 2D, 3 3D and above. */
    int gps_satellites{0};

    bool connected{false};
    std::string last_heartbeat{};   /**< ISO-8601 time of the last heartbeat. */
    std::string updated_at{};       /**< ISO-8601 time of the last update. */

    /** @brief Position using the relative altitude, as used for navigation. */
    [[nodiscard]] GeodeticCoordinate position() const noexcept {
        return GeodeticCoordinate{latitude_deg, longitude_deg, altitude_rel_m};
    }

    /** @brief Battery percentage when the vehicle reports one. */
    [[nodiscard]] std::optional<int> known_battery_percent() const noexcept {
        if (battery_percent < 0) {
            return std::nullopt;
        }
        return battery_percent;
    }
};

void to_json(nlohmann::json& json_value, const TelemetryState& state);

/**
 * @brief Lock-protected telemetry snapshot.
 *
 * Each update applies a group of related fields atomically with respect to
 * readers; readers always receive a complete copy.
 */
class TelemetryStore final {
  public:
    using Mutation = std::function<void(TelemetryState&)>;

    /** @brief Apply @p mutation under the lock and stamp `updated_at`. */
    void update(const Mutation& mutation);

    [[nodiscard]] TelemetryState snapshot() const;

    [[nodiscard]] GeodeticCoordinate position() const;

  private:
    mutable std::mutex mutex_;
    TelemetryState struct_state_{};
};

}  // namespace drone_sentry
