// === Alert Publisher =========================================================
//
// Outbound publish channel for alerts, mission status and telemetry. The
// pub/sub transport is an external collaborator; the built-in implementation
// appends `{"topic","payload"}` JSON lines to an outbox file that a bridge
// process can forward.

#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include "drone_sentry/errors.hpp"

namespace drone_sentry {

class AlertPublisher {
  public:
    virtual ~AlertPublisher() = default;

    [[nodiscard]] virtual bool is_connected() const = 0;
    [[nodiscard]] virtual Status publish_alert(const nlohmann::json& alert) = 0;
    [[nodiscard]] virtual Status publish_status(const nlohmann::json& status) = 0;
    [[nodiscard]] virtual Status publish_telemetry(const nlohmann::json& telemetry) = 0;
};

/** @brief Appends one JSON document per message to an outbox file. */
class JsonLinesAlertPublisher final : public AlertPublisher {
  public:
    JsonLinesAlertPublisher(std::filesystem::path outbox_path, std::string drone_id, std::string topic_prefix = "drone");

    [[nodiscard]] bool is_connected() const override;
    [[nodiscard]] Status publish_alert(const nlohmann::json& alert) override;
    [[nodiscard]] Status publish_status(const nlohmann::json& status) override;
    [[nodiscard]] Status publish_telemetry(const nlohmann::json& telemetry) override;

    [[nodiscard]] const std::filesystem::path& outbox_path() const noexcept { return outbox_path_; }

  private:
    [[nodiscard]] Status publish(const std::string& channel, const nlohmann::json& payload);

    std::filesystem::path outbox_path_;
    std::string str_drone_id_;
    std::string str_topic_prefix_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
    std::ofstream stream_outbox_;
};

}  // namespace drone_sentry
