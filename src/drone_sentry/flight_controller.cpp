#include "drone_sentry/flight_controller.hpp"

#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "drone_sentry/geodesy.hpp"
#include "drone_sentry/logging.hpp"
#include "drone_sentry/timestamp.hpp"

namespace drone_sentry {

namespace {
constexpr int k_data_stream_rate_hz{4};

double radians_to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}
}  // namespace

FlightController::FlightController(std::unique_ptr<VehicleLink> link, FlightConfig config)
    : link_(std::move(link)),
      config_(std::move(config)),
      logger_(get_logger()) {
    if (!link_) {
        throw std::invalid_argument("FlightController requires a vehicle link");
    }
}

FlightController::~FlightController() {
    disconnect();
}

Status FlightController::connect() {
    std::scoped_lock lock(link_mutex_);
    logger_->info("Connecting to flight controller: {}", link_->describe());

    if (Status opened = link_->open(); !opened) {
        logger_->error("Connection failed: {}", opened.error().message);
        return make_error(ErrorKind::ConnectionFailure, opened.error().message);
    }

    const auto deadline = SteadyClock::now() + to_steady(config_.heartbeat_timeout);
    bool heartbeat_seen = false;
    while (!heartbeat_seen && SteadyClock::now() < deadline) {
        const Duration remaining = deadline - SteadyClock::now();
        const auto message = link_->receive(remaining);
        if (!message) {
            continue;
        }
        heartbeat_seen = std::holds_alternative<HeartbeatMessage>(*message);
        apply(*message);
    }

    if (!heartbeat_seen) {
        link_->close();
        logger_->error("No heartbeat received within {:.1f}s", config_.heartbeat_timeout.count());
        return make_error(
            ErrorKind::ConnectionFailure,
            fmt::format("No heartbeat received within {:.1f}s", config_.heartbeat_timeout.count())
        );
    }

    link_->request_data_streams(k_data_stream_rate_hz);
    flag_connected_ = true;
    telemetry_.update([](TelemetryState& state) { state.connected = true; });
    logger_->info("Connected to {}", link_->describe());
    return Status::success();
}

void FlightController::update_telemetry() {
    if (!flag_connected_) {
        return;
    }
    std::scoped_lock lock(link_mutex_);
    drain_locked();
}

void FlightController::drain_locked() {
    while (auto message = link_->receive(Duration::zero())) {
        if (const auto* ack = std::get_if<CommandAckMessage>(&*message)) {
            logger_->debug("Ignoring unsolicited ack for command {}", static_cast<int>(ack->command));
            continue;
        }
        apply(*message);
    }
}

void FlightController::apply(const VehicleMessage& message) {
    if (const auto* heartbeat = std::get_if<HeartbeatMessage>(&message)) {
        const std::string mode{copter_mode_name(heartbeat->custom_mode)};
        const bool armed = (heartbeat->base_mode & k_mode_flag_safety_armed) != 0;
        const std::string str_now = now_iso8601();
        telemetry_.update([&](TelemetryState& state) {
            state.armed = armed;
            state.mode = mode;
            state.connected = true;
            state.last_heartbeat = str_now;
        });
    } else if (const auto* position = std::get_if<GlobalPositionMessage>(&message)) {
        telemetry_.update([position](TelemetryState& state) {
            state.latitude_deg = static_cast<double>(position->lat_e7) / 1e7;
            state.longitude_deg = static_cast<double>(position->lon_e7) / 1e7;
            state.altitude_msl_m = static_cast<double>(position->alt_mm) / 1000.0;
            state.altitude_rel_m = static_cast<double>(position->relative_alt_mm) / 1000.0;
            state.velocity_north_mps = static_cast<double>(position->vx_cms) / 100.0;
            state.velocity_east_mps = static_cast<double>(position->vy_cms) / 100.0;
            state.velocity_down_mps = static_cast<double>(position->vz_cms) / 100.0;
            state.yaw_deg = static_cast<double>(position->hdg_cdeg) / 100.0;
        });
    } else if (const auto* gps = std::get_if<GpsRawMessage>(&message)) {
        telemetry_.update([gps](TelemetryState& state) {
            state.gps_fix_type = gps->fix_type;
            state.gps_satellites = gps->satellites_visible;
        });
    } else if (const auto* status = std::get_if<SystemStatusMessage>(&message)) {
        telemetry_.update([status](TelemetryState& state) {
            state.battery_percent = status->battery_remaining >= 0 ? status->battery_remaining : -1;
            state.battery_voltage_v = static_cast<double>(status->voltage_battery_mv) / 1000.0;
        });
    } else if (const auto* attitude = std::get_if<AttitudeMessage>(&message)) {
        telemetry_.update([attitude](TelemetryState& state) {
            state.roll_deg = radians_to_degrees(attitude->roll_rad);
            state.pitch_deg = radians_to_degrees(attitude->pitch_rad);
            state.yaw_deg = radians_to_degrees(attitude->yaw_rad);
        });
    } else if (const auto* hud = std::get_if<VfrHudMessage>(&message)) {
        telemetry_.update([hud](TelemetryState& state) { state.groundspeed_mps = hud->groundspeed_mps; });
    }
}

Status FlightController::require_connection() const {
    if (!flag_connected_) {
        return make_error(ErrorKind::ConnectionFailure, "Flight controller not connected");
    }
    return Status::success();
}

Status FlightController::set_mode(std::string_view mode_name) {
    const auto mode = parse_copter_mode(mode_name);
    if (!mode) {
        logger_->error("Unknown mode: {}", mode_name);
        return make_error(ErrorKind::InvalidArgument, fmt::format("Unknown mode: {}", mode_name));
    }
    if (Status connected = require_connection(); !connected) {
        return connected;
    }

    const std::string expected{copter_mode_name(static_cast<std::uint32_t>(*mode))};
    {
        std::scoped_lock lock(link_mutex_);
        link_->send_set_mode(static_cast<std::uint32_t>(*mode));
    }

    for (int attempt = 0; attempt < config_.mode_confirm_attempts; ++attempt) {
        {
            std::scoped_lock lock(link_mutex_);
            drain_locked();
        }
        if (telemetry_.snapshot().mode == expected) {
            logger_->info("Mode changed to {}", expected);
            return Status::success();
        }
        std::this_thread::sleep_for(to_steady(config_.mode_confirm_interval));
    }

    logger_->warn("Mode change to {} may not have completed", expected);
    return make_error(ErrorKind::ModeChangeUnconfirmed, fmt::format("Mode change to {} not confirmed", expected));
}

Status FlightController::arm() {
    CommandLong command{};
    command.command = MavCommand::ComponentArmDisarm;
    command.params[0] = 1.0F;
    return send_and_wait(command);
}

Status FlightController::disarm() {
    CommandLong command{};
    command.command = MavCommand::ComponentArmDisarm;
    return send_and_wait(command);
}

Status FlightController::takeoff(double altitude_m) {
    CommandLong command{};
    command.command = MavCommand::NavTakeoff;
    command.params[6] = static_cast<float>(altitude_m);
    logger_->info("Takeoff command sent: {:.1f}m", altitude_m);
    return send_and_wait(command);
}

Status FlightController::set_speed(double speed_mps) {
    CommandLong command{};
    command.command = MavCommand::DoChangeSpeed;
    command.params[0] = 0.0F;   // groundspeed
    command.params[1] = static_cast<float>(speed_mps);
    command.params[2] = -1.0F;  // throttle unchanged
    return send_and_wait(command);
}

Status FlightController::send_and_wait(const CommandLong& command) {
    if (Status connected = require_connection(); !connected) {
        return connected;
    }
    std::scoped_lock lock(link_mutex_);
    link_->send_command_long(command);
    return wait_for_ack_locked(command.command, config_.ack_timeout);
}

Status FlightController::wait_for_ack_locked(MavCommand command, Duration timeout) {
    const auto deadline = SteadyClock::now() + to_steady(timeout);
    while (SteadyClock::now() < deadline) {
        const Duration remaining = deadline - SteadyClock::now();
        const auto message = link_->receive(remaining);
        if (!message) {
            continue;
        }
        const auto* ack = std::get_if<CommandAckMessage>(&*message);
        if (ack == nullptr) {
            apply(*message);
            continue;
        }
        if (ack->command != command) {
            continue;
        }
        if (ack->result == MavResult::Accepted) {
            return Status::success();
        }
        logger_->warn("Command {} rejected: result={}", static_cast<int>(command), static_cast<int>(ack->result));
        return make_error(
            ErrorKind::CommandRejected,
            fmt::format("Command {} rejected with result {}", static_cast<int>(command), static_cast<int>(ack->result))
        );
    }
    logger_->warn("Timeout waiting for ACK on command {}", static_cast<int>(command));
    return make_error(
        ErrorKind::AckTimeout,
        fmt::format("No acknowledgement for command {} within {:.1f}s", static_cast<int>(command), timeout.count())
    );
}

void FlightController::go_to(const GeodeticCoordinate& target) {
    if (!flag_connected_) {
        logger_->warn("Goto ignored: flight controller not connected");
        return;
    }
    PositionTarget position_target{};
    position_target.lat_e7 = static_cast<std::int32_t>(std::lround(target.latitude_deg * 1e7));
    position_target.lon_e7 = static_cast<std::int32_t>(std::lround(target.longitude_deg * 1e7));
    position_target.relative_alt_m = static_cast<float>(target.altitude_m);
    {
        std::scoped_lock lock(link_mutex_);
        link_->send_position_target(position_target);
    }
    logger_->debug("Goto: {:.7f}, {:.7f}, {:.1f}m", target.latitude_deg, target.longitude_deg, target.altitude_m);
}

Status FlightController::land() {
    return set_mode("LAND");
}

Status FlightController::rtl() {
    return set_mode("RTL");
}

bool FlightController::reached_waypoint(const GeodeticCoordinate& target, std::optional<double> tolerance_m) const {
    const double distance_m = haversine_distance_m(telemetry_.position(), target);
    return distance_m <= tolerance_m.value_or(config_.waypoint_tolerance_m);
}

void FlightController::disconnect() {
    if (!flag_connected_.exchange(false)) {
        return;
    }
    {
        std::scoped_lock lock(link_mutex_);
        link_->close();
    }
    telemetry_.update([](TelemetryState& state) { state.connected = false; });
    logger_->info("Disconnected from flight controller");
}

TelemetryState FlightController::telemetry() const {
    return telemetry_.snapshot();
}

GeodeticCoordinate FlightController::location() const {
    return telemetry_.position();
}

bool FlightController::is_connected() const noexcept {
    return flag_connected_;
}

const FlightConfig& FlightController::config() const noexcept {
    return config_;
}

}  // namespace drone_sentry
