// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects that describe storage, flight
// link, patrol, alerting and command-channel settings consumed across the
// mission core. `ConfigurationLoader` translates environment variables into
// these structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <filesystem>
#include <string>

#include "drone_sentry/types.hpp"

namespace drone_sentry {

/** @brief Filesystem locations for identity material, the database and evidence. */
struct StorageConfig final {
    std::filesystem::path identity_dir{"identity"};
    std::filesystem::path db_path{"drone_sentry.db"};
    std::filesystem::path detections_dir{"detections"};
    std::filesystem::path outbox_path{"outbox.jsonl"};
};

/** @brief Link and command handshake settings for the flight protocol layer. */
struct FlightConfig final {
    std::string connection{"sim://"};
    Duration heartbeat_timeout{5.0};
    Duration ack_timeout{5.0};
    int mode_confirm_attempts{10};
    Duration mode_confirm_interval{0.2};
    double waypoint_tolerance_m{2.0};
    double sim_time_scale{1.0};        /**< Simulated-vehicle physics speed-up factor. */
};

/** @brief Patrol loop pacing and safety thresholds. */
struct PatrolConfig final {
    Duration loop_interval{0.1};
    Duration waypoint_hover{5.0};
    Duration detection_loiter{10.0};
    double rtl_battery_percent{25.0};
    double min_preflight_battery_percent{30.0};
    Duration altitude_timeout{30.0};
    double altitude_reached_ratio{0.9};
    Duration pause_poll_interval{0.5};
};

/** @brief Alert deduplication and evidence crop settings. */
struct AlertConfig final {
    Duration cooldown{30.0};
    int crop_padding_px{50};
};

/** @brief Operator command freshness window. */
struct CommandConfig final {
    Duration max_command_age{30.0};
};

/**
 * @brief Immutable bundle of runtime knobs for the mission core.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{"logs"};
    std::string log_level{"info"};
    StorageConfig storage{};
    FlightConfig flight{};
    PatrolConfig patrol{};
    AlertConfig alerts{};
    CommandConfig commands{};
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /**
     * @brief Read every `DRONE_SENTRY_*` variable, apply defaults, and
     *        initialise the shared logger in the configured directory.
     */
    static Configuration load();
};

}  // namespace drone_sentry
