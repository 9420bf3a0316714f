// === Alert Pipeline ==========================================================
//
// Turns raw detections into signed, stored and published findings. One
// pipeline belongs to one mission and is driven only by that mission's control
// loop, so the per-class cooldown map needs no locking.

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "drone_sentry/camera_feed.hpp"
#include "drone_sentry/configuration.hpp"
#include "drone_sentry/detector.hpp"
#include "drone_sentry/errors.hpp"
#include "drone_sentry/models.hpp"
#include "drone_sentry/types.hpp"

namespace drone_sentry {

class AlertPublisher;
class AuditLog;
class CryptoEngine;
class DataStore;
class IdGenerator;

class AlertPipeline final {
  public:
    /**
     * @param publisher may be null; publishing is then skipped.
     */
    AlertPipeline(
        std::shared_ptr<DataStore> store,
        std::shared_ptr<const CryptoEngine> crypto,
        std::shared_ptr<AuditLog> audit,
        std::shared_ptr<AlertPublisher> publisher,
        std::shared_ptr<IdGenerator> id_generator,
        std::string mission_id,
        std::filesystem::path detections_dir,
        AlertConfig config = {}
    );

    /**
     * @brief Process one detection batch taken from @p frame at @p position.
     *
     * Detections whose class alerted less than `cooldown` ago are skipped
     * without side effects. Each remaining detection writes an evidence crop,
     * becomes a signed Finding, is stored, audited as `detection` and
     * published when a publisher is connected. A detection that cannot be
     * cropped, signed or stored is logged and skipped; the rest of the batch
     * still runs. A stored finding whose audit append fails is kept, logged
     * and published, since the signed record already exists. Publish failures
     * are logged and ignored.
     *
     * @return Findings created by this call, or the last failure when
     *         detections were attempted and none produced a finding.
     */
    [[nodiscard]] Result<std::vector<Finding>> process_detections(
        const std::vector<Detection>& detections,
        const CameraFrame& frame,
        const GeodeticCoordinate& position
    );

    [[nodiscard]] const std::string& mission_id() const noexcept { return str_mission_id_; }

  private:
    [[nodiscard]] Result<Finding> create_finding(
        const Detection& detection,
        const CameraFrame& frame,
        const GeodeticCoordinate& position
    );
    void publish_alert(const Finding& finding);

    std::shared_ptr<DataStore> store_;
    std::shared_ptr<const CryptoEngine> crypto_;
    std::shared_ptr<AuditLog> audit_;
    std::shared_ptr<AlertPublisher> publisher_;
    std::shared_ptr<IdGenerator> id_generator_;
    std::string str_mission_id_;
    std::filesystem::path detections_dir_;
    AlertConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::map<std::string, TimePoint, std::less<>> map_last_alert_;
};

}  // namespace drone_sentry
