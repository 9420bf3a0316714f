#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include "drone_sentry/alert_pipeline.hpp"
#include "drone_sentry/alert_publisher.hpp"
#include "drone_sentry/camera_feed.hpp"
#include "drone_sentry/detector.hpp"
#include "logging_test_fixture.hpp"
#include "test_workspace.hpp"

using namespace drone_sentry;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_sentry::test::ensure_logger_initialized();
    return true;
}();

/** @brief Publisher that records payloads and can be told to fail. */
class RecordingPublisher final : public AlertPublisher {
  public:
    bool is_connected() const override { return true; }
    Status publish_alert(const nlohmann::json& alert) override { return record(list_alerts, alert); }
    Status publish_status(const nlohmann::json& status) override { return record(list_statuses, status); }
    Status publish_telemetry(const nlohmann::json& telemetry) override { return record(list_telemetry, telemetry); }

    bool flag_fail{false};
    std::vector<nlohmann::json> list_alerts{};
    std::vector<nlohmann::json> list_statuses{};
    std::vector<nlohmann::json> list_telemetry{};

  private:
    Status record(std::vector<nlohmann::json>& sink, const nlohmann::json& payload) {
        if (flag_fail) {
            return make_error(ErrorKind::IoFailure, "broker unreachable");
        }
        sink.push_back(payload);
        return Status::success();
    }
};

CameraFrame test_frame() {
    SyntheticCameraFeed camera{SyntheticCameraOptions{64, 48, 10.0, false}};
    camera.capture_once();
    return *camera.read();
}

Detection detection_of(const std::string& class_name, double confidence = 0.9) {
    return Detection{class_name, 0, confidence, 10, 10, 30, 30};
}

struct PipelineFixture final {
    drone_sentry::test::ProvisionedDrone drone{};
    std::shared_ptr<RecordingPublisher> publisher{std::make_shared<RecordingPublisher>()};
    Mission struct_mission{};
    std::unique_ptr<AlertPipeline> pipeline{};

    explicit PipelineFixture(Duration cooldown = Duration{30.0}) {
        struct_mission = Mission::create(*drone.id_generator, "test", {Waypoint{32.7473, -117.1661, std::nullopt}});
        REQUIRE(drone.store->save_mission(struct_mission).ok());

        AlertConfig config{};
        config.cooldown = cooldown;
        config.crop_padding_px = 5;
        pipeline = std::make_unique<AlertPipeline>(
            drone.store,
            drone.crypto,
            drone.audit,
            publisher,
            drone.id_generator,
            struct_mission.id,
            drone.workspace.path() / "detections",
            config
        );
    }
};

/** @brief Run @p sql on a separate connection to the store's database. */
void execute_sql(const std::filesystem::path& db_path, const std::string& sql) {
    sqlite3* connection = nullptr;
    REQUIRE(sqlite3_open(db_path.string().c_str(), &connection) == SQLITE_OK);
    char* message = nullptr;
    const int rc = sqlite3_exec(connection, sql.c_str(), nullptr, nullptr, &message);
    sqlite3_free(message);
    sqlite3_close(connection);
    REQUIRE(rc == SQLITE_OK);
}

const GeodeticCoordinate k_position{32.7473, -117.1661, 30.0};
}  // namespace

TEST_CASE("Synthetic camera publishes frames only once started") {
    SyntheticCameraFeed camera{SyntheticCameraOptions{32, 24, 50.0, false}};
    REQUIRE(camera.read() == nullptr);

    REQUIRE(camera.start().ok());
    REQUIRE(camera.is_open());
    const auto first = camera.read();
    REQUIRE(first != nullptr);
    REQUIRE(first->buffer.size() == 32 * 24 * 3);
    camera.stop();
    REQUIRE_FALSE(camera.is_open());

    SyntheticCameraFeed broken{SyntheticCameraOptions{32, 24, 10.0, true}};
    REQUIRE(broken.start().kind() == ErrorKind::IoFailure);
}

TEST_CASE("crop_frame pads and clamps to the frame") {
    const CameraFrame frame = test_frame();

    const CameraFrame inner = crop_frame(frame, 10, 10, 20, 20, 5);
    REQUIRE(inner.width_px == 20);
    REQUIRE(inner.height_px == 20);

    const CameraFrame edge = crop_frame(frame, 0, 0, 10, 10, 50);
    REQUIRE(edge.width_px == 60);
    REQUIRE(edge.height_px == 48);

    REQUIRE(crop_frame(frame, 500, 500, 600, 600, 0).empty());
}

TEST_CASE("write_ppm writes a P6 header and pixel data") {
    drone_sentry::test::TemporaryDirectory directory{};
    const CameraFrame frame = crop_frame(test_frame(), 0, 0, 4, 2, 0);
    const auto file_path = directory.path() / "crop.ppm";

    REQUIRE(write_ppm(file_path, frame).ok());
    std::ifstream stream(file_path, std::ios::binary);
    std::string magic;
    int width = 0;
    int height = 0;
    int max_value = 0;
    stream >> magic >> width >> height >> max_value;
    REQUIRE(magic == "P6");
    REQUIRE(width == 4);
    REQUIRE(height == 2);
    REQUIRE(max_value == 255);
}

TEST_CASE("Synthetic detector replays scripts before periodic detections") {
    SyntheticDetectorOptions options{};
    options.every_n_frames = 2;
    SyntheticDetector detector{options};
    CameraFrame frame = test_frame();

    detector.script({detection_of("vehicle"), detection_of("person")});
    REQUIRE(detector.detect(frame).size() == 2);

    frame.frame_id = 3;
    REQUIRE(detector.detect(frame).empty());
    frame.frame_id = 4;
    const auto periodic = detector.detect(frame);
    REQUIRE(periodic.size() == 1);
    REQUIRE(periodic.front().class_name == "person");
    REQUIRE(periodic.front().area() > 0);

    SyntheticDetector offline{SyntheticDetectorOptions{"person", 0, 0.9, 1, 80, false}};
    REQUIRE_FALSE(offline.is_ready());
    REQUIRE(offline.backend_name() == "none");
    REQUIRE(offline.detect(frame).empty());
}

TEST_CASE("A detection becomes a signed, stored, audited and published finding") {
    PipelineFixture fixture{};
    const CameraFrame frame = test_frame();

    const auto findings = fixture.pipeline->process_detections({detection_of("person", 0.8766)}, frame, k_position);
    REQUIRE(findings.ok());
    REQUIRE(findings.value().size() == 1);
    const Finding& finding = findings.value().front();

    REQUIRE(finding.mission_id == fixture.struct_mission.id);
    REQUIRE(finding.lat == Approx(k_position.latitude_deg));
    REQUIRE(std::filesystem::exists(finding.image_path));
    REQUIRE(finding.image_hash == CryptoEngine::hash_bytes(std::span<const std::byte>(frame.buffer)));
    REQUIRE(fixture.drone.crypto->verify_signature(finding.signable_payload(), finding.signature));

    const auto stored = fixture.drone.store->get_finding(finding.id);
    REQUIRE(stored.value().has_value());

    const auto recent = fixture.drone.audit->get_recent(1).value();
    REQUIRE(recent.front().action == "detection");
    REQUIRE(recent.front().details.at("finding_id") == finding.id);
    REQUIRE(recent.front().details.at("confidence").get<double>() == Approx(0.877));

    REQUIRE(fixture.publisher->list_alerts.size() == 1);
    REQUIRE(fixture.publisher->list_alerts.front().at("signature") == finding.signature);
    REQUIRE(fixture.publisher->list_alerts.front().at("location").at("alt").get<double>() == Approx(30.0));
}

TEST_CASE("Finding signatures fail after the record is altered") {
    PipelineFixture fixture{};
    const auto findings = fixture.pipeline->process_detections({detection_of("person")}, test_frame(), k_position);
    REQUIRE(findings.ok());

    Finding altered = findings.value().front();
    altered.lat += 0.001;
    REQUIRE_FALSE(fixture.drone.crypto->verify_signature(altered.signable_payload(), altered.signature));

    altered = findings.value().front();
    altered.detection_class = "vehicle";
    REQUIRE_FALSE(fixture.drone.crypto->verify_signature(altered.signable_payload(), altered.signature));
}

TEST_CASE("Cooldown suppresses repeats of a class but not other classes") {
    PipelineFixture fixture{};
    const CameraFrame frame = test_frame();

    REQUIRE(fixture.pipeline->process_detections({detection_of("person")}, frame, k_position).value().size() == 1);
    REQUIRE(fixture.pipeline->process_detections({detection_of("person")}, frame, k_position).value().empty());
    REQUIRE(fixture.pipeline->process_detections({detection_of("vehicle")}, frame, k_position).value().size() == 1);

    REQUIRE(fixture.drone.store->get_finding_count(fixture.struct_mission.id).value() == 2);
    REQUIRE(fixture.publisher->list_alerts.size() == 2);
}

TEST_CASE("Same-class detections in one batch alert once") {
    PipelineFixture fixture{};
    const auto findings = fixture.pipeline->process_detections(
        {detection_of("person"), detection_of("person"), detection_of("vehicle")},
        test_frame(),
        k_position
    );
    REQUIRE(findings.value().size() == 2);
}

TEST_CASE("Without a cooldown every detection alerts") {
    PipelineFixture fixture{Duration{0.0}};
    const CameraFrame frame = test_frame();

    REQUIRE(fixture.pipeline->process_detections({detection_of("person")}, frame, k_position).value().size() == 1);
    REQUIRE(fixture.pipeline->process_detections({detection_of("person")}, frame, k_position).value().size() == 1);
}

TEST_CASE("Publish failures do not lose the finding") {
    PipelineFixture fixture{};
    fixture.publisher->flag_fail = true;

    const auto findings = fixture.pipeline->process_detections({detection_of("person")}, test_frame(), k_position);
    REQUIRE(findings.ok());
    REQUIRE(findings.value().size() == 1);
    REQUIRE(fixture.drone.store->get_finding_count(fixture.struct_mission.id).value() == 1);
    REQUIRE(fixture.drone.audit->verify_chain().value().count == 1);
}

TEST_CASE("JSON-lines publisher writes topic-addressed lines") {
    drone_sentry::test::TemporaryDirectory directory{};
    JsonLinesAlertPublisher publisher{directory.path() / "out" / "outbox.jsonl", "drone-9"};
    REQUIRE(publisher.is_connected());

    REQUIRE(publisher.publish_alert({{"finding_id", "f-1"}}).ok());
    REQUIRE(publisher.publish_status({{"status", "completed"}}).ok());

    std::ifstream stream(publisher.outbox_path());
    std::string line;
    REQUIRE(std::getline(stream, line));
    const auto first = nlohmann::json::parse(line);
    REQUIRE(first.at("topic") == "drone/alerts/drone-9");
    REQUIRE(first.at("payload").at("finding_id") == "f-1");
    REQUIRE(std::getline(stream, line));
    REQUIRE(nlohmann::json::parse(line).at("topic") == "drone/status/drone-9");
}

TEST_CASE("A failed audit append keeps the stored finding and the rest of the batch") {
    PipelineFixture fixture{};
    execute_sql(
        fixture.drone.store->path(),
        "CREATE TRIGGER audit_offline BEFORE INSERT ON audit_log BEGIN SELECT RAISE(ABORT, 'audit offline'); END;"
    );

    const auto findings = fixture.pipeline->process_detections(
        {detection_of("person"), detection_of("vehicle")},
        test_frame(),
        k_position
    );
    REQUIRE(findings.ok());
    REQUIRE(findings.value().size() == 2);
    REQUIRE(fixture.drone.store->get_finding_count(fixture.struct_mission.id).value() == 2);
    REQUIRE(fixture.publisher->list_alerts.size() == 2);
    REQUIRE(fixture.drone.audit->verify_chain().value().count == 0);
}

TEST_CASE("A detection that cannot be stored does not drop the others") {
    PipelineFixture fixture{};
    execute_sql(
        fixture.drone.store->path(),
        "CREATE TRIGGER reject_person BEFORE INSERT ON findings WHEN NEW.detection_class = 'person' "
        "BEGIN SELECT RAISE(ABORT, 'person rejected'); END;"
    );
    const CameraFrame frame = test_frame();

    const auto mixed = fixture.pipeline->process_detections({detection_of("person"), detection_of("vehicle")}, frame, k_position);
    REQUIRE(mixed.ok());
    REQUIRE(mixed.value().size() == 1);
    REQUIRE(mixed.value().front().detection_class == "vehicle");
    REQUIRE(fixture.publisher->list_alerts.size() == 1);
}

TEST_CASE("A batch where nothing can be stored reports the failure") {
    PipelineFixture fixture{};
    execute_sql(
        fixture.drone.store->path(),
        "CREATE TRIGGER reject_all BEFORE INSERT ON findings BEGIN SELECT RAISE(ABORT, 'store offline'); END;"
    );

    const auto failed = fixture.pipeline->process_detections({detection_of("person")}, test_frame(), k_position);
    REQUIRE_FALSE(failed.ok());
    REQUIRE(failed.kind() == ErrorKind::StoreFailure);
    REQUIRE(fixture.publisher->list_alerts.empty());
    REQUIRE(fixture.drone.audit->verify_chain().value().count == 0);
}
