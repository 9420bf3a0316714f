// === Data Models =============================================================
//
// Persistent entities of the mission core: missions, signed findings and
// hash-chained audit entries. JSON conversion is provided through
// nlohmann::json so the data store, the alert payloads and the CLI all share
// one encoding.

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "drone_sentry/errors.hpp"
#include "drone_sentry/types.hpp"

namespace drone_sentry {

class IdGenerator;

/** @brief Persisted lifecycle status of a mission. */
enum class MissionStatus {
    Idle,
    Preflight,
    Active,
    Paused,
    Completed,
    Aborted
};

[[nodiscard]] std::string_view to_string(MissionStatus status) noexcept;

[[nodiscard]] std::optional<MissionStatus> parse_mission_status(std::string_view text) noexcept;

/**
 * @brief Whether the mission state machine allows moving from @p from to @p to.
 *
 * idle->preflight; preflight->idle|active|aborted; active->paused|completed|aborted;
 * paused->active|aborted.
 */
[[nodiscard]] bool is_valid_transition(MissionStatus from, MissionStatus to) noexcept;

/** @brief Per-mission flight and detection settings. */
struct MissionParameters final {
    double altitude_m{30.0};
    double speed_mps{5.0};
    double camera_angle_deg{-90.0};
    bool loop{true};
    std::vector<std::string> detection_classes{"person", "vehicle"};

    friend bool operator==(const MissionParameters&, const MissionParameters&) = default;
};

/** @brief Patrol definition. Waypoints are fixed once the mission is created. */
struct Mission final {
    std::string id{};
    std::string type{"surveillance"};
    MissionStatus status{MissionStatus::Idle};
    std::string created_at{};
    std::string created_by{};
    std::vector<Waypoint> waypoints{};
    MissionParameters parameters{};

    /** @brief Build a new idle mission with a fresh id and the current timestamp. */
    [[nodiscard]] static Mission create(
        IdGenerator& id_generator,
        std::string created_by,
        std::vector<Waypoint> waypoints,
        MissionParameters parameters = {}
    );
};

/** @brief Signed record of one qualifying detection. */
struct Finding final {
    std::string id{};
    std::string mission_id{};
    std::string timestamp{};
    double lat{};
    double lon{};
    double alt{};
    std::string detection_class{};
    double confidence{};
    std::string image_path{};
    std::string image_hash{};
    std::string signature{};   /**< Base64 Ed25519 signature over signable_payload(). */

    /**
     * @brief Canonical bytes covered by the signature.
     *
     * `mission_id|timestamp|lat|lon|alt|class|confidence|image_hash` with 8
     * decimals for coordinates, 2 for altitude and 4 for confidence. The id
     * and signature are excluded.
     */
    [[nodiscard]] std::string signable_payload() const;
};

/**
 * @brief Key-sorted map of primitive values attached to an audit entry.
 *
 * Always a JSON object; nlohmann's default object type keeps keys sorted so
 * canonical_details() is reproducible.
 */
using AuditDetails = nlohmann::json;

/** @brief One link of the tamper-evident audit chain. */
struct AuditEntry final {
    std::string id{};
    std::string timestamp{};
    std::string actor{};
    std::string action{};
    AuditDetails details = AuditDetails::object();
    std::string prev_hash{};   /**< content_hash() of the previous entry; empty for genesis. */
    std::string signature{};

    /** @brief Compact key-sorted JSON of the details map. */
    [[nodiscard]] std::string canonical_details() const;

    /** @brief `timestamp|actor|action|canonical_details|prev_hash`. */
    [[nodiscard]] std::string signable_payload() const;

    /** @brief Hex SHA-256 over signable_payload() followed by the signature text. */
    [[nodiscard]] std::string content_hash() const;
};

/** @brief Compact key-sorted encoding used wherever JSON is hashed or MAC'd. */
[[nodiscard]] std::string canonical_json(const nlohmann::json& value);

void to_json(nlohmann::json& json_value, const Waypoint& waypoint);
void to_json(nlohmann::json& json_value, const MissionParameters& parameters);
void to_json(nlohmann::json& json_value, const Mission& mission);
void to_json(nlohmann::json& json_value, const Finding& finding);
void to_json(nlohmann::json& json_value, const AuditEntry& entry);

/** @brief Parse `[{"lat":..,"lon":..,"alt"?:..}, ...]`. */
[[nodiscard]] Result<std::vector<Waypoint>> parse_waypoints(const nlohmann::json& json_value);

[[nodiscard]] Result<MissionParameters> parse_mission_parameters(const nlohmann::json& json_value);

[[nodiscard]] Result<Mission> parse_mission(const nlohmann::json& json_value);

/** @brief Read and parse a waypoint file. */
[[nodiscard]] Result<std::vector<Waypoint>> load_waypoint_file(const std::filesystem::path& file_path);

}  // namespace drone_sentry
