// === Simulated Vehicle Link ==================================================
//
// In-process multicopter standing in for a SITL autopilot. A physics thread
// owns the vehicle model, advances it on a fixed tick and publishes telemetry
// through a MessageBus; commands arrive on the caller's thread and are applied
// under the model lock. Fault injection lets tests reject commands, drop
// acknowledgements, refuse mode changes, silence the link or force battery
// readings.

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

#include "drone_sentry/types.hpp"
#include "drone_sentry/vehicle_link.hpp"

namespace drone_sentry {

/** @brief Physical and environmental parameters of the simulated airframe. */
struct SimulatedVehicleOptions final {
    GeodeticCoordinate home{32.7473, -117.1661, 0.0};  /**< Launch point; altitude is MSL of home. */
    double time_scale{1.0};                             /**< Simulated seconds per wall-clock second. */
    Duration tick{0.05};                                /**< Wall-clock physics period. */
    double cruise_speed_mps{5.0};
    double climb_rate_mps{3.0};
    double descent_rate_mps{1.5};
    double battery_percent{100.0};
    double battery_drain_percent_per_s{0.02};           /**< Drain while armed, in simulated seconds. */
    double full_voltage_v{16.8};
    double empty_voltage_v{13.2};
    int gps_fix_type{3};
    int gps_satellites{12};
};

/** @brief Record of one command the simulated vehicle received. */
struct ReceivedCommand final {
    enum class Kind {
        SetMode,
        CommandLong,
        PositionTarget,
        DataStreamRequest
    };

    Kind kind{Kind::SetMode};
    std::uint32_t custom_mode{};
    MavCommand command{};
    std::array<float, 7> params{};
    GeodeticCoordinate target{};
};

class SimulatedVehicleLink final : public VehicleLink {
  public:
    explicit SimulatedVehicleLink(SimulatedVehicleOptions options = {});
    ~SimulatedVehicleLink() override;

    SimulatedVehicleLink(const SimulatedVehicleLink&) = delete;
    SimulatedVehicleLink& operator=(const SimulatedVehicleLink&) = delete;

    [[nodiscard]] Status open() override;
    [[nodiscard]] std::optional<VehicleMessage> receive(Duration timeout) override;
    void send_set_mode(std::uint32_t custom_mode) override;
    void send_command_long(const CommandLong& command) override;
    void send_position_target(const PositionTarget& target) override;
    void request_data_streams(int rate_hz) override;
    void close() override;
    [[nodiscard]] std::string describe() const override;

    // Fault injection
    void reject_command(MavCommand command);
    void drop_ack(MavCommand command);
    void refuse_mode(CopterMode mode);
    void set_silent(bool silent);
    void override_battery(std::optional<double> battery_percent);
    void set_gps(int fix_type, int satellites);

    // Inspection
    [[nodiscard]] std::vector<ReceivedCommand> received_commands() const;
    [[nodiscard]] GeodeticCoordinate position() const;
    [[nodiscard]] bool armed() const;
    [[nodiscard]] std::uint32_t custom_mode() const;

    /** @brief Advance the model by @p simulated_dt and publish one telemetry burst. */
    void step(Duration simulated_dt);

  private:
    struct VehicleModel final {
        GeodeticCoordinate position{};     /**< Altitude relative to home. */
        std::uint32_t custom_mode{static_cast<std::uint32_t>(CopterMode::Stabilize)};
        bool armed{false};
        double speed_mps{};
        double heading_deg{};
        double vertical_speed_mps{};       /**< Positive when climbing. */
        double battery_percent{};
        double cruise_speed_mps{};
        std::optional<double> takeoff_altitude_m{};
        std::optional<GeodeticCoordinate> guided_target{};
    };

    void run();
    void advance(Duration simulated_dt);
    void fly_towards(const GeodeticCoordinate& target, double delta_seconds);
    void climb_towards(double altitude_m, double delta_seconds);
    void descend_and_disarm(double delta_seconds);
    void publish_telemetry();
    void acknowledge(MavCommand command, MavResult result);

    SimulatedVehicleOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    MessageBus bus_;

    mutable std::mutex model_mutex_;
    VehicleModel struct_model_;
    std::set<MavCommand> set_rejected_commands_;
    std::set<MavCommand> set_dropped_acks_;
    std::set<std::uint32_t> set_refused_modes_;
    std::optional<double> optional_battery_override_;
    int gps_fix_type_;
    int gps_satellites_;
    std::vector<ReceivedCommand> list_received_commands_;

    std::atomic<bool> flag_silent_{false};
    std::atomic<bool> flag_running_{false};
    std::thread thread_physics_;
};

}  // namespace drone_sentry
