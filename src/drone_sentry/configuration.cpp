// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the mission core. `ConfigurationLoader` transforms raw environment variables
// into the strongly-typed `Configuration` structure consumed downstream.
//
// Responsibilities
// - Enforce defaults and sane bounds for timeouts, thresholds and paths.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or violates expectations.
//
// Note: This file avoids reading from disk; callers are expected to populate
// the process environment ahead of time (e.g., a shell-sourced `.env`).

#include "drone_sentry/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "drone_sentry/logging.hpp"

namespace drone_sentry {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};

double parse_double(const char* str_name, double fallback, bool allow_zero = false) {
    const char* raw_value = std::getenv(str_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value < 0.0 || (!allow_zero && parsed_value == 0.0)) {
            get_logger()->warn("{}={} is out of range; using fallback {}", str_name, raw_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} as a number; using fallback {}", str_name, fallback);
        return fallback;
    }
}

Duration parse_seconds(const char* str_name, Duration fallback) {
    return Duration{parse_double(str_name, fallback.count())};
}

double parse_percent(const char* str_name, double fallback) {
    const double parsed_value = parse_double(str_name, fallback, true);
    if (parsed_value > 100.0) {
        get_logger()->warn("{} above 100; using fallback {}", str_name, fallback);
        return fallback;
    }
    return parsed_value;
}

int parse_int(const char* str_name, int fallback) {
    const char* raw_value = std::getenv(str_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        return parsed_value <= 0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} as an integer; using fallback {}", str_name, fallback);
        return fallback;
    }
}

std::string parse_string(const char* str_name, std::string fallback) {
    const char* raw_value = std::getenv(str_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return fallback;
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("DRONE_SENTRY_LOG_DIR", std::string{k_default_log_directory});

    auto logger = initialize_logger(config.log_directory);
    config.log_level = parse_string("DRONE_SENTRY_LOG_LEVEL", config.log_level);
    set_log_level(config.log_level);
    logger->info("Loading configuration from environment");

    StorageConfig& storage = config.storage;
    storage.identity_dir = parse_string("DRONE_SENTRY_IDENTITY_DIR", storage.identity_dir.string());
    storage.db_path = parse_string("DRONE_SENTRY_DB_PATH", storage.db_path.string());
    storage.detections_dir = parse_string("DRONE_SENTRY_DETECTIONS_DIR", storage.detections_dir.string());
    storage.outbox_path = parse_string("DRONE_SENTRY_OUTBOX_PATH", storage.outbox_path.string());

    FlightConfig& flight = config.flight;
    flight.connection = parse_string("DRONE_SENTRY_CONNECTION", flight.connection);
    flight.heartbeat_timeout = parse_seconds("DRONE_SENTRY_HEARTBEAT_TIMEOUT_S", flight.heartbeat_timeout);
    flight.ack_timeout = parse_seconds("DRONE_SENTRY_ACK_TIMEOUT_S", flight.ack_timeout);
    flight.mode_confirm_attempts = parse_int("DRONE_SENTRY_MODE_CONFIRM_ATTEMPTS", flight.mode_confirm_attempts);
    flight.mode_confirm_interval = parse_seconds("DRONE_SENTRY_MODE_CONFIRM_INTERVAL_S", flight.mode_confirm_interval);
    flight.waypoint_tolerance_m = parse_double("DRONE_SENTRY_WAYPOINT_TOLERANCE_M", flight.waypoint_tolerance_m);
    flight.sim_time_scale = parse_double("DRONE_SENTRY_SIM_TIME_SCALE", flight.sim_time_scale);

    PatrolConfig& patrol = config.patrol;
    patrol.loop_interval = parse_seconds("DRONE_SENTRY_LOOP_INTERVAL_S", patrol.loop_interval);
    patrol.waypoint_hover = Duration{parse_double("DRONE_SENTRY_WAYPOINT_HOVER_S", patrol.waypoint_hover.count(), true)};
    patrol.detection_loiter = Duration{parse_double("DRONE_SENTRY_DETECTION_LOITER_S", patrol.detection_loiter.count(), true)};
    patrol.rtl_battery_percent = parse_percent("DRONE_SENTRY_RTL_BATTERY_PCT", patrol.rtl_battery_percent);
    patrol.min_preflight_battery_percent =
        parse_percent("DRONE_SENTRY_MIN_PREFLIGHT_BATTERY_PCT", patrol.min_preflight_battery_percent);
    patrol.altitude_timeout = parse_seconds("DRONE_SENTRY_ALTITUDE_TIMEOUT_S", patrol.altitude_timeout);
    patrol.altitude_reached_ratio = parse_double("DRONE_SENTRY_ALTITUDE_REACHED_RATIO", patrol.altitude_reached_ratio);
    if (patrol.altitude_reached_ratio > 1.0) {
        logger->warn("DRONE_SENTRY_ALTITUDE_REACHED_RATIO above 1.0; clamping");
        patrol.altitude_reached_ratio = 1.0;
    }
    patrol.pause_poll_interval = parse_seconds("DRONE_SENTRY_PAUSE_POLL_INTERVAL_S", patrol.pause_poll_interval);

    config.alerts.cooldown = Duration{parse_double("DRONE_SENTRY_ALERT_COOLDOWN_S", config.alerts.cooldown.count(), true)};
    config.alerts.crop_padding_px = parse_int("DRONE_SENTRY_CROP_PADDING_PX", config.alerts.crop_padding_px);

    config.commands.max_command_age = parse_seconds("DRONE_SENTRY_MAX_COMMAND_AGE_S", config.commands.max_command_age);

    logger->info(
        "Configuration loaded: connection={} db={} identity_dir={} rtl_battery_pct={} cooldown_s={}",
        flight.connection,
        storage.db_path.string(),
        storage.identity_dir.string(),
        patrol.rtl_battery_percent,
        config.alerts.cooldown.count()
    );

    return config;
}

}  // namespace drone_sentry
