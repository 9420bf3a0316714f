// === Mission Controller ======================================================
//
// Patrol state machine tying flight, capture, detection, alerting and audit
// together. One control thread runs start() and the patrol loop; pause(),
// resume() and abort() may be called from any other thread (operator command
// channel, signal handler) and are observed by the loop within one polling
// interval.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "drone_sentry/configuration.hpp"
#include "drone_sentry/detector.hpp"
#include "drone_sentry/errors.hpp"
#include "drone_sentry/models.hpp"
#include "drone_sentry/types.hpp"

namespace drone_sentry {

class AlertPipeline;
class AlertPublisher;
class AuditLog;
class DataStore;
class FlightController;
class FrameSource;

/** @brief Collaborators a mission runs against. Only `publisher` may be null. */
struct MissionServices final {
    std::shared_ptr<FlightController> flight;
    std::shared_ptr<FrameSource> camera;
    std::shared_ptr<ObjectDetector> detector;
    std::shared_ptr<DataStore> store;
    std::shared_ptr<AuditLog> audit;
    std::shared_ptr<AlertPipeline> alerts;
    std::shared_ptr<AlertPublisher> publisher;
};

class MissionController final {
  public:
    MissionController(Mission mission, MissionServices services, PatrolConfig config = {});
    ~MissionController() = default;

    MissionController(const MissionController&) = delete;
    MissionController& operator=(const MissionController&) = delete;

    /**
     * @brief Run every readiness check without touching the vehicle.
     *
     * @return All failing conditions; empty when the mission may start.
     */
    [[nodiscard]] std::vector<std::string> preflight_check();

    /**
     * @brief Preflight, launch and fly the patrol until it completes or stops.
     *
     * Blocks the calling thread. Fails with PreflightFailure (all reasons
     * attached) before any vehicle command is issued, or with the flight error
     * when mode change, arming or takeoff fails. Otherwise returns the
     * terminal status: Completed, or Aborted after abort() or a battery RTL.
     */
    [[nodiscard]] Result<MissionStatus> start();

    /** @brief Hold position at the next loop pass. Valid only while Active. */
    [[nodiscard]] Status pause();
    /** @brief Continue towards the current waypoint. Valid only while Paused. */
    [[nodiscard]] Status resume();
    /** @brief Stop the patrol, return to launch and persist Aborted. */
    [[nodiscard]] Status abort(const std::string& reason = "operator");

    [[nodiscard]] Mission mission() const;
    [[nodiscard]] MissionStatus status() const;
    [[nodiscard]] bool is_running() const noexcept { return flag_running_; }
    [[nodiscard]] bool is_paused() const noexcept { return flag_paused_; }
    [[nodiscard]] std::size_t current_waypoint_index() const noexcept { return current_waypoint_index_; }
    [[nodiscard]] std::size_t total_findings() const noexcept { return total_findings_; }

  private:
    [[nodiscard]] Status transition_to(MissionStatus next);
    [[nodiscard]] Result<MissionStatus> fail_start(const std::string& step, const Error& error);
    bool wait_for_altitude(double target_altitude_m);
    void run_patrol_loop();
    std::size_t run_cycle(const GeodeticCoordinate& target);
    [[nodiscard]] std::size_t process_frame();
    [[nodiscard]] bool check_battery();
    void hold_while_paused(const GeodeticCoordinate& target);
    void publish_telemetry_if_due();
    /** @brief Persist Completed, then land. False while the mission is paused. */
    [[nodiscard]] bool complete();
    /** @brief Persist Aborted, then RTL. Refused once the mission has finished. */
    [[nodiscard]] Status terminate(const std::string& reason);
    void audit(const std::string& action, AuditDetails details = AuditDetails::object());
    void sleep_for(Duration duration) const;

    MissionServices services_;
    PatrolConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex state_mutex_;
    Mission struct_mission_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> flag_running_{false};
    std::atomic<bool> flag_paused_{false};
    std::atomic<bool> flag_finished_{false};
    std::atomic<std::size_t> current_waypoint_index_{0};
    std::atomic<std::size_t> total_findings_{0};
    std::vector<std::string> list_detection_classes_;
    std::optional<std::uint64_t> optional_last_frame_id_;
    TimePoint last_telemetry_publish_{};
};

}  // namespace drone_sentry
