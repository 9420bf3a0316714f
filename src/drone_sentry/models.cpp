#include "drone_sentry/models.hpp"

#include <array>
#include <fstream>
#include <utility>

#include <fmt/format.h>

#include "drone_sentry/digest.hpp"
#include "drone_sentry/id_generator.hpp"
#include "drone_sentry/timestamp.hpp"

namespace drone_sentry {

namespace {

struct StatusName final {
    MissionStatus status;
    std::string_view name;
};

constexpr std::array<StatusName, 6> k_status_names{{
    {MissionStatus::Idle, "idle"},
    {MissionStatus::Preflight, "preflight"},
    {MissionStatus::Active, "active"},
    {MissionStatus::Paused, "paused"},
    {MissionStatus::Completed, "completed"},
    {MissionStatus::Aborted, "aborted"},
}};

Error invalid_field(std::string_view field, std::string_view expectation) {
    return make_error(ErrorKind::InvalidArgument, fmt::format("'{}' {}", field, expectation));
}

}  // namespace

std::string_view to_string(MissionStatus status) noexcept {
    for (const auto& entry : k_status_names) {
        if (entry.status == status) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<MissionStatus> parse_mission_status(std::string_view text) noexcept {
    for (const auto& entry : k_status_names) {
        if (entry.name == text) {
            return entry.status;
        }
    }
    return std::nullopt;
}

bool is_valid_transition(MissionStatus from, MissionStatus to) noexcept {
    switch (from) {
        case MissionStatus::Idle:
            return to == MissionStatus::Preflight;
        case MissionStatus::Preflight:
            return to == MissionStatus::Idle || to == MissionStatus::Active || to == MissionStatus::Aborted;
        case MissionStatus::Active:
            return to == MissionStatus::Paused || to == MissionStatus::Completed || to == MissionStatus::Aborted;
        case MissionStatus::Paused:
            return to == MissionStatus::Active || to == MissionStatus::Aborted;
        case MissionStatus::Completed:
        case MissionStatus::Aborted:
            return false;
    }
    return false;
}

Mission Mission::create(
    IdGenerator& id_generator,
    std::string created_by,
    std::vector<Waypoint> waypoints,
    MissionParameters parameters
) {
    Mission mission{};
    mission.id = id_generator.next();
    mission.created_at = now_iso8601();
    mission.created_by = std::move(created_by);
    mission.waypoints = std::move(waypoints);
    mission.parameters = std::move(parameters);
    return mission;
}

std::string Finding::signable_payload() const {
    return fmt::format(
        "{}|{}|{:.8f}|{:.8f}|{:.2f}|{}|{:.4f}|{}",
        mission_id,
        timestamp,
        lat,
        lon,
        alt,
        detection_class,
        confidence,
        image_hash
    );
}

std::string canonical_json(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string AuditEntry::canonical_details() const {
    return canonical_json(details.is_null() ? AuditDetails::object() : details);
}

std::string AuditEntry::signable_payload() const {
    return fmt::format("{}|{}|{}|{}|{}", timestamp, actor, action, canonical_details(), prev_hash);
}

std::string AuditEntry::content_hash() const {
    return sha256_hex(signable_payload() + signature);
}

void to_json(nlohmann::json& json_value, const Waypoint& waypoint) {
    json_value = nlohmann::json{{"lat", waypoint.latitude_deg}, {"lon", waypoint.longitude_deg}};
    if (waypoint.altitude_m) {
        json_value["alt"] = *waypoint.altitude_m;
    }
}

void to_json(nlohmann::json& json_value, const MissionParameters& parameters) {
    json_value = nlohmann::json{
        {"altitude_m", parameters.altitude_m},
        {"speed_mps", parameters.speed_mps},
        {"camera_angle_deg", parameters.camera_angle_deg},
        {"loop", parameters.loop},
        {"detection_classes", parameters.detection_classes},
    };
}

void to_json(nlohmann::json& json_value, const Mission& mission) {
    json_value = nlohmann::json{
        {"id", mission.id},
        {"type", mission.type},
        {"status", std::string{to_string(mission.status)}},
        {"created_at", mission.created_at},
        {"created_by", mission.created_by},
        {"waypoints", mission.waypoints},
        {"parameters", mission.parameters},
    };
}

void to_json(nlohmann::json& json_value, const Finding& finding) {
    json_value = nlohmann::json{
        {"id", finding.id},
        {"mission_id", finding.mission_id},
        {"timestamp", finding.timestamp},
        {"lat", finding.lat},
        {"lon", finding.lon},
        {"alt", finding.alt},
        {"detection_class", finding.detection_class},
        {"confidence", finding.confidence},
        {"image_path", finding.image_path},
        {"image_hash", finding.image_hash},
        {"signature", finding.signature},
    };
}

void to_json(nlohmann::json& json_value, const AuditEntry& entry) {
    json_value = nlohmann::json{
        {"id", entry.id},
        {"timestamp", entry.timestamp},
        {"actor", entry.actor},
        {"action", entry.action},
        {"details", entry.details},
        {"prev_hash", entry.prev_hash},
        {"signature", entry.signature},
    };
}

Result<std::vector<Waypoint>> parse_waypoints(const nlohmann::json& json_value) {
    if (!json_value.is_array()) {
        return invalid_field("waypoints", "must be an array");
    }
    std::vector<Waypoint> list_waypoints;
    list_waypoints.reserve(json_value.size());
    for (std::size_t index = 0; index < json_value.size(); ++index) {
        const nlohmann::json& item = json_value[index];
        const auto lat_it = item.is_object() ? item.find("lat") : item.end();
        const auto lon_it = item.is_object() ? item.find("lon") : item.end();
        if (!item.is_object() || lat_it == item.end() || lon_it == item.end() || !lat_it->is_number()
            || !lon_it->is_number()) {
            return invalid_field(fmt::format("waypoints[{}]", index), "needs numeric lat and lon");
        }
        Waypoint waypoint{lat_it->get<double>(), lon_it->get<double>(), std::nullopt};
        if (const auto alt_it = item.find("alt"); alt_it != item.end() && !alt_it->is_null()) {
            if (!alt_it->is_number()) {
                return invalid_field(fmt::format("waypoints[{}].alt", index), "must be numeric");
            }
            waypoint.altitude_m = alt_it->get<double>();
        }
        list_waypoints.push_back(waypoint);
    }
    return list_waypoints;
}

Result<MissionParameters> parse_mission_parameters(const nlohmann::json& json_value) {
    if (!json_value.is_object()) {
        return invalid_field("parameters", "must be an object");
    }
    MissionParameters parameters{};
    try {
        parameters.altitude_m = json_value.value("altitude_m", parameters.altitude_m);
        parameters.speed_mps = json_value.value("speed_mps", parameters.speed_mps);
        parameters.camera_angle_deg = json_value.value("camera_angle_deg", parameters.camera_angle_deg);
        parameters.loop = json_value.value("loop", parameters.loop);
        parameters.detection_classes = json_value.value("detection_classes", parameters.detection_classes);
    } catch (const nlohmann::json::exception& error) {
        return invalid_field("parameters", error.what());
    }
    return parameters;
}

Result<Mission> parse_mission(const nlohmann::json& json_value) {
    if (!json_value.is_object()) {
        return invalid_field("mission", "must be an object");
    }
    Mission mission{};
    try {
        mission.id = json_value.at("id").get<std::string>();
        mission.type = json_value.value("type", mission.type);
        mission.created_at = json_value.at("created_at").get<std::string>();
        mission.created_by = json_value.value("created_by", std::string{});
        const auto status = parse_mission_status(json_value.at("status").get<std::string>());
        if (!status) {
            return invalid_field("status", "is not a known mission status");
        }
        mission.status = *status;
    } catch (const nlohmann::json::exception& error) {
        return invalid_field("mission", error.what());
    }

    auto waypoints = parse_waypoints(json_value.value("waypoints", nlohmann::json::array()));
    if (!waypoints) {
        return waypoints.error();
    }
    mission.waypoints = std::move(waypoints).value();

    auto parameters = parse_mission_parameters(json_value.value("parameters", nlohmann::json::object()));
    if (!parameters) {
        return parameters.error();
    }
    mission.parameters = std::move(parameters).value();
    return mission;
}

Result<std::vector<Waypoint>> load_waypoint_file(const std::filesystem::path& file_path) {
    std::ifstream stream(file_path);
    if (!stream) {
        return make_error(ErrorKind::IoFailure, "Unable to open waypoint file " + file_path.string());
    }
    const nlohmann::json document = nlohmann::json::parse(stream, nullptr, false);
    if (document.is_discarded()) {
        return make_error(ErrorKind::InvalidArgument, "Waypoint file is not valid JSON: " + file_path.string());
    }
    return parse_waypoints(document);
}

}  // namespace drone_sentry
