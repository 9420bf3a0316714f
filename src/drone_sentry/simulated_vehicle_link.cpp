#include "drone_sentry/simulated_vehicle_link.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include <fmt/format.h>

#include "drone_sentry/geodesy.hpp"
#include "drone_sentry/logging.hpp"

namespace drone_sentry {

namespace {
constexpr double k_arrival_threshold_m{0.5};       /**< Horizontal distance treated as on-target. */
constexpr double k_ground_altitude_m{0.5};         /**< Below this the vehicle counts as landed. */
constexpr float k_force_disarm_magic{21196.0F};    /**< MAV_CMD_COMPONENT_ARM_DISARM param2 force value. */
constexpr std::uint8_t k_state_standby{3};          /**< MAV_STATE_STANDBY. */
constexpr std::uint8_t k_state_active{4};           /**< MAV_STATE_ACTIVE. */

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}
}  // namespace

SimulatedVehicleLink::SimulatedVehicleLink(SimulatedVehicleOptions options)
    : options_(options),
      logger_(get_logger()),
      gps_fix_type_(options.gps_fix_type),
      gps_satellites_(options.gps_satellites) {
    if (options_.time_scale <= 0.0 || options_.tick.count() <= 0.0) {
        throw std::invalid_argument("SimulatedVehicleLink requires a positive tick and time scale");
    }
    struct_model_.position = GeodeticCoordinate{options_.home.latitude_deg, options_.home.longitude_deg, 0.0};
    struct_model_.battery_percent = options_.battery_percent;
    struct_model_.cruise_speed_mps = options_.cruise_speed_mps;
}

SimulatedVehicleLink::~SimulatedVehicleLink() {
    close();
}

Status SimulatedVehicleLink::open() {
    if (flag_running_.exchange(true)) {
        return Status::success();
    }
    bus_.clear();
    {
        std::scoped_lock lock(model_mutex_);
        publish_telemetry();
    }
    thread_physics_ = std::thread([this] { run(); });
    logger_->info("Simulated vehicle online at {:.6f}, {:.6f} (time scale x{})",
                  options_.home.latitude_deg,
                  options_.home.longitude_deg,
                  options_.time_scale);
    return Status::success();
}

void SimulatedVehicleLink::close() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    if (thread_physics_.joinable()) {
        thread_physics_.join();
    }
    logger_->info("Simulated vehicle link closed");
}

std::string SimulatedVehicleLink::describe() const {
    return fmt::format("sim://{:.6f},{:.6f}", options_.home.latitude_deg, options_.home.longitude_deg);
}

std::optional<VehicleMessage> SimulatedVehicleLink::receive(Duration timeout) {
    if (!flag_running_) {
        return std::nullopt;
    }
    if (timeout.count() <= 0.0) {
        return bus_.try_consume();
    }
    return bus_.consume_for(timeout);
}

void SimulatedVehicleLink::run() {
    const Duration simulated_tick = options_.tick * options_.time_scale;
    while (flag_running_) {
        std::this_thread::sleep_for(to_steady(options_.tick));
        step(simulated_tick);
    }
}

void SimulatedVehicleLink::step(Duration simulated_dt) {
    std::scoped_lock lock(model_mutex_);
    advance(simulated_dt);
    publish_telemetry();
}

void SimulatedVehicleLink::advance(Duration simulated_dt) {
    VehicleModel& model = struct_model_;
    const double delta_seconds = simulated_dt.count();
    model.speed_mps = 0.0;
    model.vertical_speed_mps = 0.0;

    if (!model.armed) {
        return;
    }

    switch (static_cast<CopterMode>(model.custom_mode)) {
        case CopterMode::Guided:
            if (model.takeoff_altitude_m) {
                climb_towards(*model.takeoff_altitude_m, delta_seconds);
                if (model.position.altitude_m >= *model.takeoff_altitude_m) {
                    model.takeoff_altitude_m.reset();
                }
            } else if (model.guided_target && model.position.altitude_m > k_ground_altitude_m) {
                fly_towards(*model.guided_target, delta_seconds);
            }
            break;
        case CopterMode::Rtl:
        case CopterMode::SmartRtl: {
            const GeodeticCoordinate home{options_.home.latitude_deg, options_.home.longitude_deg, model.position.altitude_m};
            if (haversine_distance_m(model.position, home) > k_arrival_threshold_m) {
                fly_towards(home, delta_seconds);
            } else {
                descend_and_disarm(delta_seconds);
            }
            break;
        }
        case CopterMode::Land:
            descend_and_disarm(delta_seconds);
            break;
        default:
            // LOITER, BRAKE and the manual modes hold position in the model.
            break;
    }

    model.battery_percent = std::max(0.0, model.battery_percent - options_.battery_drain_percent_per_s * delta_seconds);
}

void SimulatedVehicleLink::fly_towards(const GeodeticCoordinate& target, double delta_seconds) {
    VehicleModel& model = struct_model_;
    climb_towards(target.altitude_m, delta_seconds);

    const double distance_m = haversine_distance_m(model.position, target);
    if (distance_m <= k_arrival_threshold_m) {
        return;
    }
    model.heading_deg = initial_bearing_deg(model.position, target);
    const double travel_distance = model.cruise_speed_mps * delta_seconds;
    model.speed_mps = model.cruise_speed_mps;
    if (travel_distance >= distance_m) {
        model.position.latitude_deg = target.latitude_deg;
        model.position.longitude_deg = target.longitude_deg;
        return;
    }
    const double altitude_m = model.position.altitude_m;
    model.position = advance_coordinate(model.position, travel_distance, model.heading_deg);
    model.position.altitude_m = altitude_m;
}

void SimulatedVehicleLink::climb_towards(double altitude_m, double delta_seconds) {
    VehicleModel& model = struct_model_;
    const double altitude_error = altitude_m - model.position.altitude_m;
    const double max_delta = (altitude_error >= 0.0 ? options_.climb_rate_mps : options_.descent_rate_mps) * delta_seconds;
    const double limited_delta = std::clamp(altitude_error, -max_delta, max_delta);
    model.position.altitude_m += limited_delta;
    model.vertical_speed_mps = delta_seconds > 0.0 ? limited_delta / delta_seconds : 0.0;
}

void SimulatedVehicleLink::descend_and_disarm(double delta_seconds) {
    VehicleModel& model = struct_model_;
    model.position.altitude_m = std::max(0.0, model.position.altitude_m - options_.descent_rate_mps * delta_seconds);
    model.vertical_speed_mps = -options_.descent_rate_mps;
    if (model.position.altitude_m <= 0.0) {
        model.vertical_speed_mps = 0.0;
        model.armed = false;
        model.guided_target.reset();
        model.takeoff_altitude_m.reset();
        logger_->info("Simulated vehicle landed and disarmed");
    }
}

void SimulatedVehicleLink::publish_telemetry() {
    if (flag_silent_) {
        return;
    }
    const VehicleModel& model = struct_model_;
    const double heading_rad = degrees_to_radians(model.heading_deg);
    const double battery_percent = optional_battery_override_.value_or(model.battery_percent);
    const double voltage_v = options_.empty_voltage_v
        + (options_.full_voltage_v - options_.empty_voltage_v) * std::clamp(battery_percent, 0.0, 100.0) / 100.0;

    HeartbeatMessage heartbeat{};
    heartbeat.custom_mode = model.custom_mode;
    heartbeat.base_mode = static_cast<std::uint8_t>(k_mode_flag_custom_mode | (model.armed ? k_mode_flag_safety_armed : 0));
    heartbeat.system_status = model.armed ? k_state_active : k_state_standby;
    bus_.publish(heartbeat);

    GlobalPositionMessage position{};
    position.lat_e7 = static_cast<std::int32_t>(std::lround(model.position.latitude_deg * 1e7));
    position.lon_e7 = static_cast<std::int32_t>(std::lround(model.position.longitude_deg * 1e7));
    position.relative_alt_mm = static_cast<std::int32_t>(std::lround(model.position.altitude_m * 1000.0));
    position.alt_mm = static_cast<std::int32_t>(std::lround((options_.home.altitude_m + model.position.altitude_m) * 1000.0));
    position.vx_cms = static_cast<std::int16_t>(std::lround(model.speed_mps * std::cos(heading_rad) * 100.0));
    position.vy_cms = static_cast<std::int16_t>(std::lround(model.speed_mps * std::sin(heading_rad) * 100.0));
    position.vz_cms = static_cast<std::int16_t>(std::lround(-model.vertical_speed_mps * 100.0));
    position.hdg_cdeg = static_cast<std::uint16_t>(std::lround(model.heading_deg * 100.0) % 36000);
    bus_.publish(position);

    bus_.publish(GpsRawMessage{static_cast<std::uint8_t>(gps_fix_type_), static_cast<std::uint8_t>(gps_satellites_)});
    bus_.publish(SystemStatusMessage{
        static_cast<std::uint16_t>(std::lround(voltage_v * 1000.0)),
        static_cast<std::int8_t>(std::lround(std::clamp(battery_percent, 0.0, 100.0))),
    });
    bus_.publish(AttitudeMessage{0.0F, 0.0F, static_cast<float>(heading_rad)});
    bus_.publish(VfrHudMessage{static_cast<float>(model.speed_mps), static_cast<float>(model.position.altitude_m)});
}

void SimulatedVehicleLink::acknowledge(MavCommand command, MavResult result) {
    if (set_dropped_acks_.contains(command)) {
        logger_->debug("Simulated vehicle dropping ack for command {}", static_cast<int>(command));
        return;
    }
    bus_.publish(CommandAckMessage{command, result});
}

void SimulatedVehicleLink::send_set_mode(std::uint32_t custom_mode) {
    std::scoped_lock lock(model_mutex_);
    ReceivedCommand received{};
    received.kind = ReceivedCommand::Kind::SetMode;
    received.custom_mode = custom_mode;
    list_received_commands_.push_back(received);

    if (set_refused_modes_.contains(custom_mode) || copter_mode_name(custom_mode).empty()) {
        logger_->debug("Simulated vehicle ignoring mode {}", custom_mode);
        return;
    }
    struct_model_.custom_mode = custom_mode;
}

void SimulatedVehicleLink::send_command_long(const CommandLong& command) {
    std::scoped_lock lock(model_mutex_);
    ReceivedCommand received{};
    received.kind = ReceivedCommand::Kind::CommandLong;
    received.command = command.command;
    received.params = command.params;
    list_received_commands_.push_back(received);

    if (set_rejected_commands_.contains(command.command)) {
        acknowledge(command.command, MavResult::Denied);
        return;
    }

    VehicleModel& model = struct_model_;
    switch (command.command) {
        case MavCommand::ComponentArmDisarm: {
            if (command.params[0] >= 0.5F) {
                model.armed = true;
                acknowledge(command.command, MavResult::Accepted);
                return;
            }
            const bool forced = command.params[1] == k_force_disarm_magic;
            if (model.position.altitude_m > k_ground_altitude_m && !forced) {
                acknowledge(command.command, MavResult::Denied);
                return;
            }
            model.armed = false;
            model.takeoff_altitude_m.reset();
            acknowledge(command.command, MavResult::Accepted);
            return;
        }
        case MavCommand::NavTakeoff:
            if (!model.armed || static_cast<CopterMode>(model.custom_mode) != CopterMode::Guided) {
                acknowledge(command.command, MavResult::Failed);
                return;
            }
            model.takeoff_altitude_m = static_cast<double>(command.params[6]);
            acknowledge(command.command, MavResult::Accepted);
            return;
        case MavCommand::DoChangeSpeed:
            if (command.params[1] <= 0.0F) {
                acknowledge(command.command, MavResult::Denied);
                return;
            }
            model.cruise_speed_mps = static_cast<double>(command.params[1]);
            acknowledge(command.command, MavResult::Accepted);
            return;
    }
    acknowledge(command.command, MavResult::Unsupported);
}

void SimulatedVehicleLink::send_position_target(const PositionTarget& target) {
    std::scoped_lock lock(model_mutex_);
    const GeodeticCoordinate coordinate{
        static_cast<double>(target.lat_e7) / 1e7,
        static_cast<double>(target.lon_e7) / 1e7,
        static_cast<double>(target.relative_alt_m),
    };
    ReceivedCommand received{};
    received.kind = ReceivedCommand::Kind::PositionTarget;
    received.target = coordinate;
    list_received_commands_.push_back(received);
    struct_model_.guided_target = coordinate;
}

void SimulatedVehicleLink::request_data_streams(int rate_hz) {
    std::scoped_lock lock(model_mutex_);
    ReceivedCommand received{};
    received.kind = ReceivedCommand::Kind::DataStreamRequest;
    received.params[0] = static_cast<float>(rate_hz);
    list_received_commands_.push_back(received);
}

void SimulatedVehicleLink::reject_command(MavCommand command) {
    std::scoped_lock lock(model_mutex_);
    set_rejected_commands_.insert(command);
}

void SimulatedVehicleLink::drop_ack(MavCommand command) {
    std::scoped_lock lock(model_mutex_);
    set_dropped_acks_.insert(command);
}

void SimulatedVehicleLink::refuse_mode(CopterMode mode) {
    std::scoped_lock lock(model_mutex_);
    set_refused_modes_.insert(static_cast<std::uint32_t>(mode));
}

void SimulatedVehicleLink::set_silent(bool silent) {
    flag_silent_ = silent;
}

void SimulatedVehicleLink::override_battery(std::optional<double> battery_percent) {
    std::scoped_lock lock(model_mutex_);
    optional_battery_override_ = battery_percent;
}

void SimulatedVehicleLink::set_gps(int fix_type, int satellites) {
    std::scoped_lock lock(model_mutex_);
    gps_fix_type_ = fix_type;
    gps_satellites_ = satellites;
}

std::vector<ReceivedCommand> SimulatedVehicleLink::received_commands() const {
    std::scoped_lock lock(model_mutex_);
    return list_received_commands_;
}

GeodeticCoordinate SimulatedVehicleLink::position() const {
    std::scoped_lock lock(model_mutex_);
    return struct_model_.position;
}

bool SimulatedVehicleLink::armed() const {
    std::scoped_lock lock(model_mutex_);
    return struct_model_.armed;
}

std::uint32_t SimulatedVehicleLink::custom_mode() const {
    std::scoped_lock lock(model_mutex_);
    return struct_model_.custom_mode;
}

}  // namespace drone_sentry
