#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include "drone_sentry/id_generator.hpp"
#include "drone_sentry/models.hpp"
#include "logging_test_fixture.hpp"
#include "test_workspace.hpp"

using namespace drone_sentry;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_sentry::test::ensure_logger_initialized();
    return true;
}();

Mission sample_mission(IdGenerator& id_generator) {
    MissionParameters parameters{};
    parameters.altitude_m = 45.0;
    parameters.speed_mps = 7.5;
    parameters.loop = false;
    parameters.detection_classes = {"person"};
    return Mission::create(
        id_generator,
        "operator-1",
        {Waypoint{32.7473, -117.1661, std::nullopt}, Waypoint{32.7480, -117.1650, 60.0}},
        parameters
    );
}
}  // namespace

TEST_CASE("Mission survives a JSON round trip") {
    IdGenerator id_generator{};
    const Mission mission = sample_mission(id_generator);

    const nlohmann::json encoded = mission;
    auto decoded = parse_mission(encoded);

    REQUIRE(decoded.ok());
    REQUIRE(decoded.value().id == mission.id);
    REQUIRE(decoded.value().status == MissionStatus::Idle);
    REQUIRE(decoded.value().created_by == "operator-1");
    REQUIRE(decoded.value().waypoints == mission.waypoints);
    REQUIRE(decoded.value().parameters == mission.parameters);
}

TEST_CASE("Waypoints without altitude resolve to the mission default") {
    const Waypoint waypoint{1.0, 2.0, std::nullopt};
    REQUIRE(waypoint.resolve(30.0).altitude_m == Approx(30.0));

    const Waypoint pinned{1.0, 2.0, 12.0};
    REQUIRE(pinned.resolve(30.0).altitude_m == Approx(12.0));
}

TEST_CASE("parse_waypoints rejects entries without coordinates") {
    const auto missing_lon = parse_waypoints(nlohmann::json::parse(R"([{"lat": 1.0}])"));
    REQUIRE_FALSE(missing_lon.ok());
    REQUIRE(missing_lon.kind() == ErrorKind::InvalidArgument);

    const auto not_array = parse_waypoints(nlohmann::json::parse(R"({"lat": 1.0, "lon": 2.0})"));
    REQUIRE_FALSE(not_array.ok());

    const auto text_alt = parse_waypoints(nlohmann::json::parse(R"([{"lat": 1.0, "lon": 2.0, "alt": "high"}])"));
    REQUIRE_FALSE(text_alt.ok());
}

TEST_CASE("load_waypoint_file reports unreadable and malformed files") {
    drone_sentry::test::TemporaryDirectory directory{};

    const auto missing = load_waypoint_file(directory.path() / "absent.json");
    REQUIRE(missing.kind() == ErrorKind::IoFailure);

    const auto garbage = load_waypoint_file(directory.write("garbage.json", "{not json"));
    REQUIRE(garbage.kind() == ErrorKind::InvalidArgument);

    const auto valid = load_waypoint_file(directory.write("route.json", R"([{"lat": 1, "lon": 2}, {"lat": 3, "lon": 4, "alt": 20}])"));
    REQUIRE(valid.ok());
    REQUIRE(valid.value().size() == 2);
    REQUIRE(valid.value()[1].altitude_m == 20.0);
}

TEST_CASE("Mission status transitions follow the lifecycle") {
    REQUIRE(is_valid_transition(MissionStatus::Idle, MissionStatus::Preflight));
    REQUIRE(is_valid_transition(MissionStatus::Preflight, MissionStatus::Idle));
    REQUIRE(is_valid_transition(MissionStatus::Active, MissionStatus::Paused));
    REQUIRE(is_valid_transition(MissionStatus::Paused, MissionStatus::Aborted));

    REQUIRE_FALSE(is_valid_transition(MissionStatus::Idle, MissionStatus::Active));
    REQUIRE_FALSE(is_valid_transition(MissionStatus::Paused, MissionStatus::Completed));
    REQUIRE_FALSE(is_valid_transition(MissionStatus::Completed, MissionStatus::Active));
    REQUIRE_FALSE(is_valid_transition(MissionStatus::Aborted, MissionStatus::Idle));

    REQUIRE(parse_mission_status("paused") == MissionStatus::Paused);
    REQUIRE_FALSE(parse_mission_status("flying").has_value());
}

TEST_CASE("Finding signable payload uses fixed precision and excludes the signature") {
    Finding finding{};
    finding.id = "finding-1";
    finding.mission_id = "mission-1";
    finding.timestamp = "2026-10-19T12:00:00.000000+00:00";
    finding.lat = 32.7473;
    finding.lon = -117.1661;
    finding.alt = 30.0;
    finding.detection_class = "person";
    finding.confidence = 0.87;
    finding.image_hash = "abc";

    const std::string payload = finding.signable_payload();
    REQUIRE(payload == "mission-1|2026-10-19T12:00:00.000000+00:00|32.74730000|-117.16610000|30.00|person|0.8700|abc");

    finding.signature = "sig";
    finding.id = "finding-2";
    REQUIRE(finding.signable_payload() == payload);
}

TEST_CASE("Audit entry details are canonicalised with sorted keys") {
    AuditEntry entry{};
    entry.timestamp = "t";
    entry.actor = "drone";
    entry.action = "detection";
    entry.details = {{"zeta", 1}, {"alpha", "x"}};

    REQUIRE(entry.canonical_details() == R"({"alpha":"x","zeta":1})");
    REQUIRE(entry.signable_payload() == R"(t|drone|detection|{"alpha":"x","zeta":1}|)");

    const std::string before = entry.content_hash();
    entry.signature = "changed";
    REQUIRE(entry.content_hash() != before);
}
