#include "drone_sentry/telemetry_state.hpp"

#include "drone_sentry/timestamp.hpp"

namespace drone_sentry {

void to_json(nlohmann::json& json_value, const TelemetryState& state) {
    json_value = nlohmann::json{
        {"lat", state.latitude_deg},
        {"lon", state.longitude_deg},
        {"alt_msl", state.altitude_msl_m},
        {"alt_rel", state.altitude_rel_m},
        {"roll", state.roll_deg},
        {"pitch", state.pitch_deg},
        {"yaw", state.yaw_deg},
        {"vx", state.velocity_north_mps},
        {"vy", state.velocity_east_mps},
        {"vz", state.velocity_down_mps},
        {"groundspeed", state.groundspeed_mps},
        {"battery_pct", state.battery_percent},
        {"battery_voltage", state.battery_voltage_v},
        {"armed", state.armed},
        {"mode", state.mode},
        {"gps_fix", state.gps_fix_type},
        {"gps_satellites", state.gps_satellites},
        {"connected", state.connected},
        {"last_heartbeat", state.last_heartbeat},
        {"updated_at", state.updated_at},
    };
}

void TelemetryStore::update(const Mutation& mutation) {
    const std::string str_now = now_iso8601();
    std::scoped_lock lock(mutex_);
    mutation(struct_state_);
    struct_state_.updated_at = str_now;
}

TelemetryState TelemetryStore::snapshot() const {
    std::scoped_lock lock(mutex_);
    return struct_state_;
}

GeodeticCoordinate TelemetryStore::position() const {
    std::scoped_lock lock(mutex_);
    return struct_state_.position();
}

}  // namespace drone_sentry
