#include "drone_sentry/alert_pipeline.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <span>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "drone_sentry/alert_publisher.hpp"
#include "drone_sentry/audit_log.hpp"
#include "drone_sentry/crypto_engine.hpp"
#include "drone_sentry/data_store.hpp"
#include "drone_sentry/id_generator.hpp"
#include "drone_sentry/logging.hpp"
#include "drone_sentry/timestamp.hpp"

namespace drone_sentry {

namespace {

double round_to(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::string evidence_file_name(std::string class_name) {
    std::replace_if(class_name.begin(), class_name.end(), [](char character) {
        return character == ' ' || character == '/' || character == '\\';
    }, '_');
    return fmt::format("{}_{}.ppm", class_name, format_file_stamp(WallClock::now()));
}

}  // namespace

AlertPipeline::AlertPipeline(
    std::shared_ptr<DataStore> store,
    std::shared_ptr<const CryptoEngine> crypto,
    std::shared_ptr<AuditLog> audit,
    std::shared_ptr<AlertPublisher> publisher,
    std::shared_ptr<IdGenerator> id_generator,
    std::string mission_id,
    std::filesystem::path detections_dir,
    AlertConfig config
)
    : store_(std::move(store)),
      crypto_(std::move(crypto)),
      audit_(std::move(audit)),
      publisher_(std::move(publisher)),
      id_generator_(std::move(id_generator)),
      str_mission_id_(std::move(mission_id)),
      detections_dir_(std::move(detections_dir)),
      config_(config),
      logger_(get_logger()) {
    if (!store_ || !crypto_ || !audit_ || !id_generator_) {
        throw std::invalid_argument("AlertPipeline requires a store, crypto engine, audit log and id generator");
    }
    std::error_code error;
    std::filesystem::create_directories(detections_dir_, error);
    if (error) {
        logger_->warn("Cannot create detections directory {}: {}", detections_dir_.string(), error.message());
    }
}

Result<std::vector<Finding>> AlertPipeline::process_detections(
    const std::vector<Detection>& detections,
    const CameraFrame& frame,
    const GeodeticCoordinate& position
) {
    std::vector<Finding> list_findings;
    std::optional<Error> optional_failure;
    const TimePoint now = SteadyClock::now();

    for (const Detection& detection : detections) {
        const auto last_alert = map_last_alert_.find(detection.class_name);
        if (last_alert != map_last_alert_.end() && now - last_alert->second < to_steady(config_.cooldown)) {
            logger_->debug("Cooldown active for {}, skipping detection", detection.class_name);
            continue;
        }
        map_last_alert_[detection.class_name] = now;

        Result<Finding> finding = create_finding(detection, frame, position);
        if (!finding) {
            logger_->error("Failed to record {} detection: {}", detection.class_name, finding.error().message);
            optional_failure = finding.error();
            continue;
        }
        publish_alert(finding.value());
        logger_->info("ALERT: {} ({:.1f}%) at {:.6f}, {:.6f}",
                      detection.class_name,
                      detection.confidence * 100.0,
                      position.latitude_deg,
                      position.longitude_deg);
        list_findings.push_back(std::move(finding).value());
    }
    if (list_findings.empty() && optional_failure) {
        return *optional_failure;
    }
    return list_findings;
}

Result<Finding> AlertPipeline::create_finding(
    const Detection& detection,
    const CameraFrame& frame,
    const GeodeticCoordinate& position
) {
    const std::filesystem::path image_path = detections_dir_ / evidence_file_name(detection.class_name);
    const CameraFrame crop = crop_frame(frame, detection.x1, detection.y1, detection.x2, detection.y2, config_.crop_padding_px);
    if (Status written = write_ppm(image_path, crop); !written) {
        return written.error();
    }

    Finding finding{};
    finding.id = id_generator_->next();
    finding.mission_id = str_mission_id_;
    finding.timestamp = now_iso8601();
    finding.lat = position.latitude_deg;
    finding.lon = position.longitude_deg;
    finding.alt = position.altitude_m;
    finding.detection_class = detection.class_name;
    finding.confidence = detection.confidence;
    finding.image_path = image_path.string();
    finding.image_hash = CryptoEngine::hash_bytes(std::span<const std::byte>(frame.buffer));

    Result<std::string> signature = crypto_->sign_data(finding.signable_payload());
    if (!signature) {
        return signature.error();
    }
    finding.signature = std::move(signature).value();

    if (Status saved = store_->save_finding(finding); !saved) {
        return saved.error();
    }

    AuditDetails details{
        {"finding_id", finding.id},
        {"class", detection.class_name},
        {"confidence", round_to(detection.confidence, 3)},
        {"location", nlohmann::json::array({position.latitude_deg, position.longitude_deg, position.altitude_m})},
    };
    if (Result<AuditEntry> audited = audit_->log("detection", std::move(details)); !audited) {
        logger_->error("Finding {} stored without its detection audit entry: {}", finding.id, audited.error().message);
    }
    return finding;
}

void AlertPipeline::publish_alert(const Finding& finding) {
    if (!publisher_ || !publisher_->is_connected()) {
        return;
    }
    const nlohmann::json alert{
        {"finding_id", finding.id},
        {"mission_id", finding.mission_id},
        {"timestamp", finding.timestamp},
        {"detection_class", finding.detection_class},
        {"confidence", round_to(finding.confidence, 3)},
        {"location", {{"lat", finding.lat}, {"lon", finding.lon}, {"alt", finding.alt}}},
        {"image_hash", finding.image_hash},
        {"signature", finding.signature},
    };
    if (Status published = publisher_->publish_alert(alert); !published) {
        logger_->warn("Alert {} not published: {}", finding.id, published.error().message);
    }
}

}  // namespace drone_sentry
