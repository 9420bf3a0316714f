#include <catch2/catch.hpp>

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "drone_sentry/alert_pipeline.hpp"
#include "drone_sentry/alert_publisher.hpp"
#include "drone_sentry/camera_feed.hpp"
#include "drone_sentry/detector.hpp"
#include "drone_sentry/flight_controller.hpp"
#include "drone_sentry/geodesy.hpp"
#include "drone_sentry/mission_controller.hpp"
#include "drone_sentry/operator_commands.hpp"
#include "drone_sentry/simulated_vehicle_link.hpp"
#include "drone_sentry/timestamp.hpp"
#include "logging_test_fixture.hpp"
#include "test_workspace.hpp"

using namespace drone_sentry;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_sentry::test::ensure_logger_initialized();
    return true;
}();

class StatusRecorder final : public AlertPublisher {
  public:
    bool is_connected() const override { return true; }
    Status publish_alert(const nlohmann::json& alert) override { return record(list_alerts, alert); }
    Status publish_status(const nlohmann::json& status) override { return record(list_statuses, status); }
    Status publish_telemetry(const nlohmann::json& telemetry) override { return record(list_telemetry, telemetry); }

    std::vector<nlohmann::json> snapshot_statuses() const {
        std::scoped_lock lock(mutex_);
        return list_statuses;
    }

  private:
    Status record(std::vector<nlohmann::json>& sink, const nlohmann::json& payload) {
        std::scoped_lock lock(mutex_);
        sink.push_back(payload);
        return Status::success();
    }

    mutable std::mutex mutex_;
    std::vector<nlohmann::json> list_alerts{};
    std::vector<nlohmann::json> list_statuses{};
    std::vector<nlohmann::json> list_telemetry{};
};

PatrolConfig fast_patrol_config() {
    PatrolConfig config{};
    config.loop_interval = Duration{0.01};
    config.waypoint_hover = Duration{0.05};
    config.detection_loiter = Duration{0.1};
    config.altitude_timeout = Duration{5.0};
    config.pause_poll_interval = Duration{0.02};
    return config;
}

FlightConfig fast_flight_config() {
    FlightConfig config{};
    config.heartbeat_timeout = Duration{1.0};
    config.ack_timeout = Duration{0.5};
    config.mode_confirm_attempts = 10;
    config.mode_confirm_interval = Duration{0.03};
    return config;
}

/** @brief A provisioned drone flying a simulated vehicle with every mission service wired. */
struct MissionRig final {
    drone_sentry::test::ProvisionedDrone drone{};
    SimulatedVehicleLink* vehicle{nullptr};
    std::shared_ptr<FlightController> flight{};
    std::shared_ptr<SyntheticCameraFeed> camera{std::make_shared<SyntheticCameraFeed>(SyntheticCameraOptions{64, 48, 20.0, false})};
    std::shared_ptr<SyntheticDetector> detector{};
    std::shared_ptr<StatusRecorder> publisher{std::make_shared<StatusRecorder>()};
    std::shared_ptr<MissionController> controller{};
    Mission struct_mission{};

    explicit MissionRig(
        std::vector<Waypoint> waypoints,
        bool loop = false,
        SyntheticDetectorOptions detector_options = {},
        PatrolConfig patrol_config = fast_patrol_config()
    ) {
        SimulatedVehicleOptions vehicle_options{};
        vehicle_options.time_scale = 20.0;
        vehicle_options.tick = Duration{0.02};
        auto link = std::make_unique<SimulatedVehicleLink>(vehicle_options);
        vehicle = link.get();
        flight = std::make_shared<FlightController>(std::move(link), fast_flight_config());
        detector = std::make_shared<SyntheticDetector>(detector_options);

        MissionParameters parameters{};
        parameters.altitude_m = 10.0;
        parameters.loop = loop;
        parameters.detection_classes = {"person"};
        struct_mission = Mission::create(*drone.id_generator, "test", std::move(waypoints), parameters);
        REQUIRE(drone.store->save_mission(struct_mission).ok());

        auto alerts = std::make_shared<AlertPipeline>(
            drone.store,
            drone.crypto,
            drone.audit,
            publisher,
            drone.id_generator,
            struct_mission.id,
            drone.workspace.path() / "detections"
        );
        MissionServices services{};
        services.flight = flight;
        services.camera = camera;
        services.detector = detector;
        services.store = drone.store;
        services.audit = drone.audit;
        services.alerts = alerts;
        services.publisher = publisher;
        controller = std::make_shared<MissionController>(struct_mission, services, patrol_config);
    }

    ~MissionRig() {
        camera->stop();
        flight->disconnect();
    }

    [[nodiscard]] std::vector<std::string> audit_actions() const {
        const auto entries = drone.store->all_audit_entries();
        REQUIRE(entries.ok());
        std::vector<std::string> list_actions;
        for (const AuditEntry& entry : entries.value()) {
            list_actions.push_back(entry.action);
        }
        return list_actions;
    }

    [[nodiscard]] std::optional<AuditEntry> last_audit(const std::string& action) const {
        const auto entries = drone.store->all_audit_entries().value();
        const auto found = std::find_if(entries.rbegin(), entries.rend(), [&](const AuditEntry& entry) {
            return entry.action == action;
        });
        if (found == entries.rend()) {
            return std::nullopt;
        }
        return *found;
    }

    [[nodiscard]] MissionStatus persisted_status() const {
        return drone.store->get_mission(struct_mission.id).value()->status;
    }

    [[nodiscard]] std::size_t vehicle_commands_after_connect() const {
        const auto commands = vehicle->received_commands();
        return static_cast<std::size_t>(std::count_if(commands.begin(), commands.end(), [](const ReceivedCommand& command) {
            return command.kind != ReceivedCommand::Kind::DataStreamRequest;
        }));
    }
};

std::vector<Waypoint> short_route(double distance_m = 20.0) {
    const GeodeticCoordinate home = SimulatedVehicleOptions{}.home;
    const GeodeticCoordinate first = advance_coordinate(home, distance_m, 0.0);
    const GeodeticCoordinate second = advance_coordinate(home, distance_m, 90.0);
    return {
        Waypoint{first.latitude_deg, first.longitude_deg, std::nullopt},
        Waypoint{second.latitude_deg, second.longitude_deg, std::nullopt},
    };
}

bool wait_for(const std::function<bool()>& predicate, Duration timeout = Duration{10.0}) {
    const auto deadline = SteadyClock::now() + to_steady(timeout);
    while (SteadyClock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return false;
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}
}  // namespace

TEST_CASE("MissionController requires its collaborators") {
    MissionServices services{};
    REQUIRE_THROWS_AS(MissionController(Mission{}, services), std::invalid_argument);
}

TEST_CASE("Preflight collects every failing condition") {
    MissionRig rig{std::vector<Waypoint>{}};
    rig.vehicle->override_battery(20.0);
    rig.vehicle->set_gps(1, 4);
    REQUIRE(rig.flight->connect().ok());
    std::this_thread::sleep_for(std::chrono::milliseconds{100});

    SyntheticDetectorOptions offline{};
    offline.ready = false;
    MissionRig unready{short_route(), false, offline};

    const auto issues = rig.controller->preflight_check();
    REQUIRE(contains(issues, "No waypoints defined in mission"));
    REQUIRE(contains(issues, "Battery low: 20%"));
    REQUIRE(contains(issues, "GPS fix insufficient: 1 (need 3D)"));

    const auto unready_issues = unready.controller->preflight_check();
    REQUIRE(contains(unready_issues, "Flight controller not connected"));
    REQUIRE(contains(unready_issues, "Detection model not loaded"));
}

TEST_CASE("Failed preflight issues no vehicle commands and returns to idle") {
    MissionRig rig{short_route()};
    rig.vehicle->override_battery(15.0);
    REQUIRE(rig.flight->connect().ok());
    std::this_thread::sleep_for(std::chrono::milliseconds{100});

    const auto outcome = rig.controller->start();
    REQUIRE_FALSE(outcome.ok());
    REQUIRE(outcome.kind() == ErrorKind::PreflightFailure);
    REQUIRE(contains(outcome.error().reasons, "Battery low: 15%"));

    REQUIRE(rig.vehicle_commands_after_connect() == 0);
    REQUIRE(rig.controller->status() == MissionStatus::Idle);
    REQUIRE(rig.persisted_status() == MissionStatus::Idle);

    const auto entry = rig.last_audit("preflight_failed");
    REQUIRE(entry.has_value());
    REQUIRE(entry->details.at("reasons").size() == outcome.error().reasons.size());
    REQUIRE_FALSE(contains(rig.audit_actions(), "mission_start"));
}

TEST_CASE("Single-pass patrol visits every waypoint and completes") {
    SyntheticDetectorOptions detector_options{};
    detector_options.every_n_frames = 1;
    MissionRig rig{short_route(), false, detector_options};
    REQUIRE(rig.flight->connect().ok());
    std::this_thread::sleep_for(std::chrono::milliseconds{100});

    const auto outcome = rig.controller->start();
    REQUIRE(outcome.ok());
    REQUIRE(outcome.value() == MissionStatus::Completed);
    REQUIRE(rig.persisted_status() == MissionStatus::Completed);
    REQUIRE_FALSE(rig.controller->is_running());

    const auto actions = rig.audit_actions();
    REQUIRE(actions.front() == "mission_start");
    REQUIRE(std::count(actions.begin(), actions.end(), "waypoint_navigate") == 2);
    REQUIRE(actions.back() == "mission_complete");
    REQUIRE(contains(actions, "detection"));
    REQUIRE(rig.controller->total_findings() >= 1);
    REQUIRE(rig.drone.store->get_finding_count(rig.struct_mission.id).value() == static_cast<std::int64_t>(rig.controller->total_findings()));
    REQUIRE(rig.drone.audit->verify_chain().value().valid);

    REQUIRE(wait_for([&] { return rig.vehicle->custom_mode() == static_cast<std::uint32_t>(CopterMode::Land); }));
    const auto statuses = rig.publisher->snapshot_statuses();
    REQUIRE_FALSE(statuses.empty());
    REQUIRE(statuses.back().at("status") == "completed");
}

TEST_CASE("Detections outside the mission classes raise no findings") {
    SyntheticDetectorOptions detector_options{};
    detector_options.class_name = "bicycle";
    detector_options.every_n_frames = 1;
    MissionRig rig{short_route(), false, detector_options};
    REQUIRE(rig.flight->connect().ok());
    std::this_thread::sleep_for(std::chrono::milliseconds{100});

    REQUIRE(rig.controller->start().value() == MissionStatus::Completed);
    REQUIRE(rig.controller->total_findings() == 0);
    REQUIRE_FALSE(contains(rig.audit_actions(), "detection"));
}

TEST_CASE("Critical battery during patrol triggers RTL and aborts") {
    MissionRig rig{short_route(200.0), true};
    REQUIRE(rig.flight->connect().ok());
    std::this_thread::sleep_for(std::chrono::milliseconds{100});

    auto outcome = std::async(std::launch::async, [&rig] { return rig.controller->start(); });
    REQUIRE(wait_for([&] { return contains(rig.audit_actions(), "waypoint_navigate"); }));
    rig.vehicle->override_battery(10.0);

    REQUIRE(outcome.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
    const auto result = outcome.get();
    REQUIRE(result.value() == MissionStatus::Aborted);
    REQUIRE(rig.persisted_status() == MissionStatus::Aborted);

    const auto battery = rig.last_audit("battery_rtl");
    REQUIRE(battery.has_value());
    REQUIRE(battery->details.at("battery_pct") == 10);
    const auto abort_entry = rig.last_audit("mission_abort");
    REQUIRE(abort_entry.has_value());
    REQUIRE(abort_entry->details.at("reason") == "battery_critical");
    REQUIRE(rig.vehicle->custom_mode() == static_cast<std::uint32_t>(CopterMode::Rtl));
}

TEST_CASE("Pause holds position until resume and abort ends the mission") {
    MissionRig rig{short_route(200.0), true};
    REQUIRE(rig.controller->pause().kind() == ErrorKind::InvalidArgument);
    REQUIRE(rig.flight->connect().ok());
    std::this_thread::sleep_for(std::chrono::milliseconds{100});

    auto outcome = std::async(std::launch::async, [&rig] { return rig.controller->start(); });
    REQUIRE(wait_for([&] { return contains(rig.audit_actions(), "waypoint_navigate"); }));

    REQUIRE(rig.controller->pause().ok());
    REQUIRE(rig.controller->status() == MissionStatus::Paused);
    REQUIRE(rig.controller->pause().kind() == ErrorKind::InvalidArgument);
    REQUIRE(wait_for([&] { return rig.vehicle->custom_mode() == static_cast<std::uint32_t>(CopterMode::Loiter); }));

    REQUIRE(rig.controller->resume().ok());
    REQUIRE(rig.controller->status() == MissionStatus::Active);
    REQUIRE(wait_for([&] { return rig.vehicle->custom_mode() == static_cast<std::uint32_t>(CopterMode::Guided); }));

    REQUIRE(rig.controller->abort("operator").ok());
    REQUIRE(outcome.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
    REQUIRE(outcome.get().value() == MissionStatus::Aborted);
    REQUIRE(rig.controller->abort().kind() == ErrorKind::InvalidArgument);

    const auto actions = rig.audit_actions();
    REQUIRE(contains(actions, "mission_paused"));
    REQUIRE(contains(actions, "mission_resumed"));
    REQUIRE(rig.last_audit("mission_abort")->details.at("reason") == "operator");
    REQUIRE(rig.publisher->snapshot_statuses().back().at("status") == "aborted");
}

TEST_CASE("Rejected takeoff aborts the mission and disarms") {
    MissionRig rig{short_route()};
    rig.vehicle->reject_command(MavCommand::NavTakeoff);
    REQUIRE(rig.flight->connect().ok());
    std::this_thread::sleep_for(std::chrono::milliseconds{100});

    const auto outcome = rig.controller->start();
    REQUIRE_FALSE(outcome.ok());
    REQUIRE(outcome.kind() == ErrorKind::CommandRejected);
    REQUIRE(rig.persisted_status() == MissionStatus::Aborted);
    REQUIRE_FALSE(rig.vehicle->armed());

    const auto failure = rig.last_audit("mission_start_failed");
    REQUIRE(failure.has_value());
    REQUIRE(failure->details.at("step") == "takeoff");
    REQUIRE(failure->details.at("error") == "command_rejected");
}

TEST_CASE("Authenticated operator abort stops a running patrol") {
    MissionRig rig{short_route(200.0), true};
    OperatorCommandHandler handler{rig.drone.crypto, rig.drone.audit};
    handler.attach(rig.controller);
    REQUIRE(rig.flight->connect().ok());
    std::this_thread::sleep_for(std::chrono::milliseconds{100});

    auto outcome = std::async(std::launch::async, [&rig] { return rig.controller->start(); });
    REQUIRE(wait_for([&] { return contains(rig.audit_actions(), "waypoint_navigate"); }));

    const nlohmann::json payload{{"command", "abort"}, {"timestamp", now_iso8601()}};
    const nlohmann::json envelope{
        {"payload", payload},
        {"operator_id", rig.drone.provisioned.operator_id},
        {"secret", rig.drone.provisioned.operator_secret},
        {"hmac", CryptoEngine::compute_command_mac(payload, rig.drone.provisioned.operator_secret)},
    };
    const CommandOutcome handled = handler.handle(envelope);
    REQUIRE(handled.accepted);
    REQUIRE(handled.reason == "ok");

    REQUIRE(outcome.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
    REQUIRE(outcome.get().value() == MissionStatus::Aborted);
    REQUIRE(rig.last_audit("mission_abort")->details.at("reason") == "operator_command");
    REQUIRE(rig.last_audit("command_received")->actor == rig.drone.provisioned.operator_id);
}

TEST_CASE("A pause after the last waypoint cycle holds the mission until resume or abort") {
    // One short leg and a long loop interval so the pause lands while the final cycle sleeps.
    PatrolConfig config = fast_patrol_config();
    config.loop_interval = Duration{1.0};
    config.waypoint_hover = Duration{0.0};
    const GeodeticCoordinate home = SimulatedVehicleOptions{}.home;
    const GeodeticCoordinate close_by = advance_coordinate(home, 6.0, 45.0);
    MissionRig rig{{Waypoint{close_by.latitude_deg, close_by.longitude_deg, std::nullopt}}, false, {}, config};
    REQUIRE(rig.flight->connect().ok());
    std::this_thread::sleep_for(std::chrono::milliseconds{100});

    auto outcome = std::async(std::launch::async, [&rig] { return rig.controller->start(); });
    REQUIRE(wait_for([&] { return contains(rig.audit_actions(), "waypoint_navigate"); }));
    std::this_thread::sleep_for(std::chrono::milliseconds{300});
    REQUIRE(rig.controller->pause().ok());

    REQUIRE(wait_for([&] { return rig.vehicle->custom_mode() == static_cast<std::uint32_t>(CopterMode::Loiter); }));
    std::this_thread::sleep_for(std::chrono::milliseconds{1500});
    REQUIRE(outcome.wait_for(std::chrono::milliseconds{0}) == std::future_status::timeout);
    REQUIRE(rig.controller->status() == MissionStatus::Paused);
    REQUIRE(rig.persisted_status() == MissionStatus::Paused);
    REQUIRE_FALSE(contains(rig.audit_actions(), "mission_complete"));
    REQUIRE(rig.controller->is_running());

    SECTION("resume lets the mission complete and land") {
        REQUIRE(rig.controller->resume().ok());
        REQUIRE(outcome.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
        REQUIRE(outcome.get().value() == MissionStatus::Completed);
        REQUIRE(rig.persisted_status() == MissionStatus::Completed);
        REQUIRE(rig.audit_actions().back() == "mission_complete");
        REQUIRE(wait_for([&] { return rig.vehicle->custom_mode() == static_cast<std::uint32_t>(CopterMode::Land); }));
        REQUIRE(rig.controller->abort().kind() == ErrorKind::InvalidArgument);
    }

    SECTION("abort returns to launch instead of landing") {
        REQUIRE(rig.controller->abort("operator").ok());
        REQUIRE(outcome.wait_for(std::chrono::seconds{10}) == std::future_status::ready);
        REQUIRE(outcome.get().value() == MissionStatus::Aborted);
        REQUIRE(rig.persisted_status() == MissionStatus::Aborted);
        REQUIRE_FALSE(contains(rig.audit_actions(), "mission_complete"));
        REQUIRE(rig.vehicle->custom_mode() == static_cast<std::uint32_t>(CopterMode::Rtl));
    }
}
