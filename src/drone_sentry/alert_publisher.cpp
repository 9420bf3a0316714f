#include "drone_sentry/alert_publisher.hpp"

#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "drone_sentry/logging.hpp"

namespace drone_sentry {

JsonLinesAlertPublisher::JsonLinesAlertPublisher(
    std::filesystem::path outbox_path,
    std::string drone_id,
    std::string topic_prefix
)
    : outbox_path_(std::move(outbox_path)),
      str_drone_id_(std::move(drone_id)),
      str_topic_prefix_(std::move(topic_prefix)),
      logger_(get_logger()) {
    std::error_code error;
    if (outbox_path_.has_parent_path()) {
        std::filesystem::create_directories(outbox_path_.parent_path(), error);
    }
    stream_outbox_.open(outbox_path_, std::ios::out | std::ios::app);
    if (!stream_outbox_) {
        logger_->warn("Outbox {} unavailable; alerts will not be published", outbox_path_.string());
    }
}

bool JsonLinesAlertPublisher::is_connected() const {
    std::scoped_lock lock(mutex_);
    return stream_outbox_.is_open() && stream_outbox_.good();
}

Status JsonLinesAlertPublisher::publish_alert(const nlohmann::json& alert) {
    return publish("alerts", alert);
}

Status JsonLinesAlertPublisher::publish_status(const nlohmann::json& status) {
    return publish("status", status);
}

Status JsonLinesAlertPublisher::publish_telemetry(const nlohmann::json& telemetry) {
    return publish("telemetry", telemetry);
}

Status JsonLinesAlertPublisher::publish(const std::string& channel, const nlohmann::json& payload) {
    const std::string topic = fmt::format("{}/{}/{}", str_topic_prefix_, channel, str_drone_id_);
    const nlohmann::json line{{"topic", topic}, {"payload", payload}};

    std::scoped_lock lock(mutex_);
    if (!stream_outbox_.is_open() || !stream_outbox_.good()) {
        logger_->debug("Not connected, dropping message for {}", topic);
        return make_error(ErrorKind::IoFailure, fmt::format("Outbox not available for {}", topic));
    }
    stream_outbox_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    stream_outbox_.flush();
    if (!stream_outbox_) {
        logger_->error("Publish failed on {}", topic);
        return make_error(ErrorKind::IoFailure, fmt::format("Write to outbox failed for {}", topic));
    }
    return Status::success();
}

}  // namespace drone_sentry
