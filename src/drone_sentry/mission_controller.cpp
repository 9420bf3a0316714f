#include "drone_sentry/mission_controller.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "drone_sentry/alert_pipeline.hpp"
#include "drone_sentry/alert_publisher.hpp"
#include "drone_sentry/audit_log.hpp"
#include "drone_sentry/camera_feed.hpp"
#include "drone_sentry/data_store.hpp"
#include "drone_sentry/flight_controller.hpp"
#include "drone_sentry/logging.hpp"

namespace drone_sentry {

namespace {
constexpr Duration k_telemetry_publish_interval{1.0};
constexpr int k_required_gps_fix{3};
}  // namespace

MissionController::MissionController(Mission mission, MissionServices services, PatrolConfig config)
    : services_(std::move(services)),
      config_(config),
      logger_(get_logger()),
      struct_mission_(std::move(mission)) {
    if (!services_.flight || !services_.camera || !services_.detector || !services_.store || !services_.audit
        || !services_.alerts) {
        throw std::invalid_argument("MissionController requires flight, camera, detector, store, audit and alerts");
    }
}

Mission MissionController::mission() const {
    std::scoped_lock lock(state_mutex_);
    return struct_mission_;
}

MissionStatus MissionController::status() const {
    std::scoped_lock lock(state_mutex_);
    return struct_mission_.status;
}

std::vector<std::string> MissionController::preflight_check() {
    std::vector<std::string> list_issues;

    if (!services_.flight->is_connected()) {
        list_issues.emplace_back("Flight controller not connected");
    }
    if (!services_.camera->is_open()) {
        if (Status opened = services_.camera->open(); !opened) {
            list_issues.emplace_back("Camera failed to open");
        }
    }
    if (!services_.detector->is_ready()) {
        list_issues.emplace_back("Detection model not loaded");
    }
    if (mission().waypoints.empty()) {
        list_issues.emplace_back("No waypoints defined in mission");
    }

    services_.flight->update_telemetry();
    const TelemetryState telemetry = services_.flight->telemetry();
    if (const auto battery = telemetry.known_battery_percent();
        battery && *battery < config_.min_preflight_battery_percent) {
        list_issues.push_back(fmt::format("Battery low: {}%", *battery));
    }
    if (telemetry.gps_fix_type < k_required_gps_fix) {
        list_issues.push_back(fmt::format("GPS fix insufficient: {} (need 3D)", telemetry.gps_fix_type));
    }
    return list_issues;
}

Result<MissionStatus> MissionController::start() {
    if (Status preflight = transition_to(MissionStatus::Preflight); !preflight) {
        return preflight.error();
    }

    const Mission snapshot = mission();
    const std::vector<std::string> list_issues = preflight_check();
    if (!list_issues.empty()) {
        for (const auto& issue : list_issues) {
            logger_->error("Preflight: {}", issue);
        }
        audit("preflight_failed", {{"mission_id", snapshot.id}, {"reasons", list_issues}});
        if (Status reverted = transition_to(MissionStatus::Idle); !reverted) {
            logger_->warn("Mission {} left in preflight: {}", snapshot.id, reverted.error().message);
        }
        return make_error(
            ErrorKind::PreflightFailure,
            fmt::format("Preflight failed: {}", fmt::join(list_issues, "; ")),
            list_issues
        );
    }

    if (Status activated = transition_to(MissionStatus::Active); !activated) {
        return activated.error();
    }
    audit("mission_start", {{"mission_id", snapshot.id}, {"waypoints", snapshot.waypoints.size()}});

    list_detection_classes_ = snapshot.parameters.detection_classes;
    optional_last_frame_id_.reset();
    flag_finished_ = false;
    flag_paused_ = false;
    flag_running_ = true;

    const double altitude_m = snapshot.parameters.altitude_m;

    logger_->info("Setting GUIDED mode...");
    if (Status guided = services_.flight->set_mode("GUIDED"); !guided) {
        return fail_start("set_mode", guided.error());
    }
    if (!flag_running_) {
        return status();
    }

    logger_->info("Arming...");
    if (Status armed = services_.flight->arm(); !armed) {
        return fail_start("arm", armed.error());
    }
    if (!flag_running_) {
        return status();
    }

    logger_->info("Taking off to {:.1f}m...", altitude_m);
    if (Status airborne = services_.flight->takeoff(altitude_m); !airborne) {
        return fail_start("takeoff", airborne.error());
    }

    logger_->info("Waiting for altitude...");
    wait_for_altitude(altitude_m * config_.altitude_reached_ratio);
    if (!flag_running_) {
        return status();
    }

    if (Status speed = services_.flight->set_speed(snapshot.parameters.speed_mps); !speed) {
        logger_->warn("Cruise speed not confirmed: {}", speed.error().message);
    }

    if (Status capturing = services_.camera->start(); !capturing) {
        return fail_start("camera", capturing.error());
    }

    logger_->info("Patrol started with {} waypoints", snapshot.waypoints.size());
    run_patrol_loop();
    return status();
}

Result<MissionStatus> MissionController::fail_start(const std::string& step, const Error& error) {
    std::scoped_lock lock(lifecycle_mutex_);
    logger_->error("Mission start failed at {}: {}", step, error.message);
    if (flag_finished_.exchange(true)) {
        return error;
    }
    flag_running_ = false;

    if (step == "takeoff") {
        if (Status disarmed = services_.flight->disarm(); !disarmed) {
            logger_->warn("Disarm after failed takeoff not confirmed: {}", disarmed.error().message);
        }
    }
    services_.camera->stop();
    if (Status aborted = transition_to(MissionStatus::Aborted); !aborted) {
        logger_->error("Could not persist aborted mission: {}", aborted.error().message);
    }
    audit("mission_start_failed", {
        {"mission_id", mission().id},
        {"step", step},
        {"error", std::string{to_string(error.kind)}},
        {"message", error.message},
    });
    return error;
}

bool MissionController::wait_for_altitude(double target_altitude_m) {
    const auto deadline = SteadyClock::now() + to_steady(config_.altitude_timeout);
    double altitude_m = 0.0;
    while (flag_running_ && SteadyClock::now() < deadline) {
        services_.flight->update_telemetry();
        altitude_m = services_.flight->telemetry().altitude_rel_m;
        if (altitude_m >= target_altitude_m) {
            return true;
        }
        sleep_for(config_.loop_interval);
    }
    logger_->warn("Altitude timeout: wanted {:.1f}m, at {:.1f}m", target_altitude_m, altitude_m);
    return false;
}

void MissionController::run_patrol_loop() {
    const Mission snapshot = mission();
    const auto& waypoints = snapshot.waypoints;

    GeodeticCoordinate last_target{};

    while (flag_running_) {
        for (std::size_t index = 0; index < waypoints.size(); ++index) {
            if (!flag_running_) {
                break;
            }
            current_waypoint_index_ = index;
            const GeodeticCoordinate target = waypoints[index].resolve(snapshot.parameters.altitude_m);
            last_target = target;

            logger_->info("Navigating to waypoint {}: {:.6f}, {:.6f}", index, target.latitude_deg, target.longitude_deg);
            audit("waypoint_navigate", {
                {"waypoint_index", index},
                {"target", nlohmann::json::array({target.latitude_deg, target.longitude_deg, target.altitude_m})},
            });
            services_.flight->go_to(target);

            while (flag_running_ && !services_.flight->reached_waypoint(target)) {
                run_cycle(target);
                sleep_for(config_.loop_interval);
            }
            if (!flag_running_) {
                break;
            }

            logger_->debug("Reached waypoint {}, hovering {:.1f}s", index, config_.waypoint_hover.count());
            auto dwell_end = SteadyClock::now() + to_steady(config_.waypoint_hover);
            while (flag_running_ && SteadyClock::now() < dwell_end) {
                if (run_cycle(target) > 0) {
                    logger_->info("Detection at waypoint {}, loitering {:.1f}s", index, config_.detection_loiter.count());
                    dwell_end = std::max(dwell_end, SteadyClock::now() + to_steady(config_.detection_loiter));
                }
                sleep_for(config_.loop_interval);
            }
        }

        if (!flag_running_) {
            break;
        }
        if (!snapshot.parameters.loop) {
            logger_->info("Patrol complete (single pass)");
            // A pause can land after the final cycle; hold until resume or abort before finishing.
            while (flag_running_ && !complete()) {
                if (!flag_paused_) {
                    logger_->error("Mission {} cannot complete from {}", snapshot.id, to_string(status()));
                    return;
                }
                hold_while_paused(last_target);
            }
            return;
        }
        logger_->info("Patrol loop complete, restarting...");
        audit("patrol_loop_complete", {{"findings_total", total_findings_.load()}});
    }
}

std::size_t MissionController::run_cycle(const GeodeticCoordinate& target) {
    services_.flight->update_telemetry();
    if (check_battery()) {
        return 0;
    }
    if (flag_paused_) {
        hold_while_paused(target);
        if (!flag_running_) {
            return 0;
        }
    }
    const std::size_t created = process_frame();
    publish_telemetry_if_due();
    return created;
}

std::size_t MissionController::process_frame() {
    const auto frame = services_.camera->read();
    if (!frame) {
        return 0;
    }
    if (optional_last_frame_id_ == frame->frame_id) {
        return 0;
    }
    optional_last_frame_id_ = frame->frame_id;

    std::vector<Detection> detections = services_.detector->detect(*frame);
    if (!list_detection_classes_.empty()) {
        std::erase_if(detections, [this](const Detection& detection) {
            return std::find(list_detection_classes_.begin(), list_detection_classes_.end(), detection.class_name)
                == list_detection_classes_.end();
        });
    }
    if (detections.empty()) {
        return 0;
    }

    const auto findings = services_.alerts->process_detections(detections, *frame, services_.flight->location());
    if (!findings) {
        logger_->error("Alert pipeline failed: {}", findings.error().message);
        return 0;
    }
    total_findings_ += findings.value().size();
    return findings.value().size();
}

bool MissionController::check_battery() {
    const auto battery = services_.flight->telemetry().known_battery_percent();
    if (!battery || *battery >= config_.rtl_battery_percent || !flag_running_) {
        return false;
    }
    logger_->warn("Battery critical: {}% < {}%, initiating RTL", *battery, config_.rtl_battery_percent);
    audit("battery_rtl", {{"battery_pct", *battery}, {"threshold", config_.rtl_battery_percent}});
    if (Status stopped = terminate("battery_critical"); !stopped) {
        logger_->warn("Battery RTL found the mission already stopped: {}", stopped.error().message);
    }
    return true;
}

void MissionController::hold_while_paused(const GeodeticCoordinate& target) {
    logger_->info("Mission paused, holding position");
    if (Status loiter = services_.flight->set_mode("LOITER"); !loiter) {
        logger_->warn("Hold mode not confirmed: {}", loiter.error().message);
    }
    while (flag_paused_ && flag_running_) {
        services_.flight->update_telemetry();
        if (check_battery()) {
            return;
        }
        sleep_for(config_.pause_poll_interval);
    }
    if (!flag_running_) {
        return;
    }
    if (Status guided = services_.flight->set_mode("GUIDED"); !guided) {
        logger_->warn("GUIDED not confirmed on resume: {}", guided.error().message);
    }
    services_.flight->go_to(target);
    logger_->info("Mission resumed towards waypoint {}", current_waypoint_index_.load());
}

void MissionController::publish_telemetry_if_due() {
    if (!services_.publisher || !services_.publisher->is_connected()) {
        return;
    }
    const TimePoint now = SteadyClock::now();
    if (now - last_telemetry_publish_ < to_steady(k_telemetry_publish_interval)) {
        return;
    }
    last_telemetry_publish_ = now;
    nlohmann::json telemetry = services_.flight->telemetry();
    telemetry["mission_id"] = mission().id;
    if (Status published = services_.publisher->publish_telemetry(telemetry); !published) {
        logger_->debug("Telemetry not published: {}", published.error().message);
    }
}

Status MissionController::pause() {
    std::scoped_lock lock(lifecycle_mutex_);
    if (!flag_running_) {
        return make_error(ErrorKind::InvalidArgument, "Mission is not running");
    }
    if (Status paused = transition_to(MissionStatus::Paused); !paused) {
        return paused;
    }
    flag_paused_ = true;
    audit("mission_paused", {{"mission_id", mission().id}, {"waypoint_index", current_waypoint_index_.load()}});
    return Status::success();
}

Status MissionController::resume() {
    std::scoped_lock lock(lifecycle_mutex_);
    if (!flag_running_) {
        return make_error(ErrorKind::InvalidArgument, "Mission is not running");
    }
    if (Status resumed = transition_to(MissionStatus::Active); !resumed) {
        return resumed;
    }
    flag_paused_ = false;
    audit("mission_resumed", {{"mission_id", mission().id}, {"waypoint_index", current_waypoint_index_.load()}});
    return Status::success();
}

Status MissionController::abort(const std::string& reason) {
    const MissionStatus current = status();
    if (!is_valid_transition(current, MissionStatus::Aborted)) {
        return make_error(
            ErrorKind::InvalidArgument,
            fmt::format("Mission is {}, nothing to abort", to_string(current))
        );
    }
    return terminate(reason);
}

bool MissionController::complete() {
    std::scoped_lock lock(lifecycle_mutex_);
    if (flag_finished_) {
        return true;
    }
    if (Status completed = transition_to(MissionStatus::Completed); !completed) {
        if (completed.kind() != ErrorKind::StoreFailure) {
            return false;
        }
        logger_->error("Could not persist completed mission: {}", completed.error().message);
    }
    flag_finished_ = true;
    flag_running_ = false;
    const std::string mission_id = mission().id;
    logger_->info("Mission complete. Total findings: {}", total_findings_.load());

    audit("mission_complete", {{"mission_id", mission_id}, {"findings_total", total_findings_.load()}});
    if (Status landing = services_.flight->land(); !landing) {
        logger_->warn("LAND not confirmed: {}", landing.error().message);
    }
    services_.camera->stop();

    if (services_.publisher && services_.publisher->is_connected()) {
        const nlohmann::json status{
            {"mission_id", mission_id},
            {"status", "completed"},
            {"findings_total", total_findings_.load()},
        };
        if (Status published = services_.publisher->publish_status(status); !published) {
            logger_->warn("Completion status not published: {}", published.error().message);
        }
    }
    return true;
}

Status MissionController::terminate(const std::string& reason) {
    std::scoped_lock lock(lifecycle_mutex_);
    if (flag_finished_) {
        return make_error(ErrorKind::InvalidArgument, "Mission has already finished");
    }
    if (Status aborted = transition_to(MissionStatus::Aborted); !aborted) {
        if (aborted.kind() != ErrorKind::StoreFailure) {
            return aborted;
        }
        // RTL still goes out when only the status write failed.
        logger_->error("Could not persist aborted mission: {}", aborted.error().message);
    }
    flag_finished_ = true;
    flag_running_ = false;
    flag_paused_ = false;
    const std::string mission_id = mission().id;
    logger_->warn("Mission ABORTED ({})", reason);

    if (Status returning = services_.flight->rtl(); !returning) {
        logger_->error("RTL not confirmed: {}", returning.error().message);
    }
    services_.camera->stop();
    audit("mission_abort", {
        {"mission_id", mission_id},
        {"reason", reason},
        {"findings_total", total_findings_.load()},
        {"last_waypoint", current_waypoint_index_.load()},
    });

    if (services_.publisher && services_.publisher->is_connected()) {
        const nlohmann::json status{
            {"mission_id", mission_id},
            {"status", "aborted"},
            {"reason", reason},
            {"findings_total", total_findings_.load()},
        };
        if (Status published = services_.publisher->publish_status(status); !published) {
            logger_->warn("Abort status not published: {}", published.error().message);
        }
    }
    return Status::success();
}

Status MissionController::transition_to(MissionStatus next) {
    std::scoped_lock lock(state_mutex_);
    const MissionStatus current = struct_mission_.status;
    if (!is_valid_transition(current, next)) {
        logger_->warn("Refusing mission transition {} -> {}", to_string(current), to_string(next));
        return make_error(
            ErrorKind::InvalidArgument,
            fmt::format("Invalid mission transition {} -> {}", to_string(current), to_string(next))
        );
    }
    Mission updated = struct_mission_;
    updated.status = next;
    if (Status saved = services_.store->save_mission(updated); !saved) {
        logger_->error("Failed to persist mission {}: {}", updated.id, saved.error().message);
        return saved;
    }
    struct_mission_.status = next;
    logger_->info("Mission {} {} -> {}", updated.id, to_string(current), to_string(next));
    return Status::success();
}

void MissionController::audit(const std::string& action, AuditDetails details) {
    if (Result<AuditEntry> entry = services_.audit->log(action, std::move(details)); !entry) {
        logger_->error("Audit append failed for {}: {}", action, entry.error().message);
    }
}

void MissionController::sleep_for(Duration duration) const {
    std::this_thread::sleep_for(to_steady(duration));
}

}  // namespace drone_sentry
