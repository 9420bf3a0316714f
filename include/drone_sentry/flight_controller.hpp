// === Flight Controller =======================================================
//
// High-level vehicle interface used by the mission controller. Wraps a
// VehicleLink, folds inbound messages into a TelemetryStore and exposes the
// command handshake (mode confirmation, acknowledged COMMAND_LONGs, guided
// position targets). Every wait is bounded by FlightConfig.

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

#include <spdlog/logger.h>

#include "drone_sentry/configuration.hpp"
#include "drone_sentry/errors.hpp"
#include "drone_sentry/telemetry_state.hpp"
#include "drone_sentry/types.hpp"
#include "drone_sentry/vehicle_link.hpp"

namespace drone_sentry {

class FlightController final {
  public:
    FlightController(std::unique_ptr<VehicleLink> link, FlightConfig config);
    ~FlightController();

    FlightController(const FlightController&) = delete;
    FlightController& operator=(const FlightController&) = delete;

    /**
     * @brief Open the link and wait for the first heartbeat.
     *
     * Fails with ConnectionFailure when the link cannot be opened or stays
     * silent for `heartbeat_timeout`. No retry is attempted here.
     */
    [[nodiscard]] Status connect();

    /** @brief Apply every buffered message to telemetry without blocking. */
    void update_telemetry();

    /**
     * @brief Request a copter mode by name and poll until the vehicle reports it.
     *
     * Unknown names fail with InvalidArgument before anything is sent.
     */
    [[nodiscard]] Status set_mode(std::string_view mode_name);

    [[nodiscard]] Status arm();
    [[nodiscard]] Status disarm();
    /** @brief NAV_TAKEOFF to @p altitude_m; the vehicle must be armed in GUIDED. */
    [[nodiscard]] Status takeoff(double altitude_m);
    [[nodiscard]] Status set_speed(double speed_mps);

    /** @brief Send a guided position target. Does not wait for arrival. */
    void go_to(const GeodeticCoordinate& target);

    [[nodiscard]] Status land();
    [[nodiscard]] Status rtl();

    /** @brief True when within @p tolerance_m (default from config) of @p target horizontally. */
    [[nodiscard]] bool reached_waypoint(const GeodeticCoordinate& target,
                                        std::optional<double> tolerance_m = std::nullopt) const;

    void disconnect();

    [[nodiscard]] TelemetryState telemetry() const;
    [[nodiscard]] GeodeticCoordinate location() const;
    [[nodiscard]] bool is_connected() const noexcept;
    [[nodiscard]] const FlightConfig& config() const noexcept;

  private:
    void drain_locked();
    void apply(const VehicleMessage& message);
    [[nodiscard]] Status send_and_wait(const CommandLong& command);
    [[nodiscard]] Status wait_for_ack_locked(MavCommand command, Duration timeout);
    [[nodiscard]] Status require_connection() const;

    std::unique_ptr<VehicleLink> link_;
    FlightConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    TelemetryStore telemetry_;
    std::mutex link_mutex_;
    std::atomic<bool> flag_connected_{false};
};

}  // namespace drone_sentry
