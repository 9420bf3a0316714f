#include "drone_sentry/vehicle_link.hpp"

#include <array>
#include <cctype>

#include "drone_sentry/logging.hpp"
#include "drone_sentry/simulated_vehicle_link.hpp"

namespace drone_sentry {

namespace {

struct ModeName final {
    CopterMode mode;
    std::string_view name;
};

constexpr std::array<ModeName, 14> k_copter_modes{{
    {CopterMode::Stabilize, "STABILIZE"},
    {CopterMode::Acro, "ACRO"},
    {CopterMode::AltHold, "ALT_HOLD"},
    {CopterMode::Auto, "AUTO"},
    {CopterMode::Guided, "GUIDED"},
    {CopterMode::Loiter, "LOITER"},
    {CopterMode::Rtl, "RTL"},
    {CopterMode::Circle, "CIRCLE"},
    {CopterMode::Land, "LAND"},
    {CopterMode::Drift, "DRIFT"},
    {CopterMode::Sport, "SPORT"},
    {CopterMode::Brake, "BRAKE"},
    {CopterMode::GuidedNoGps, "GUIDED_NOGPS"},
    {CopterMode::SmartRtl, "SMART_RTL"},
}};

bool equals_ignore_case(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t index = 0; index < lhs.size(); ++index) {
        if (std::toupper(static_cast<unsigned char>(lhs[index])) != std::toupper(static_cast<unsigned char>(rhs[index]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<CopterMode> parse_copter_mode(std::string_view name) noexcept {
    for (const auto& entry : k_copter_modes) {
        if (equals_ignore_case(entry.name, name)) {
            return entry.mode;
        }
    }
    return std::nullopt;
}

std::string_view copter_mode_name(std::uint32_t custom_mode) noexcept {
    for (const auto& entry : k_copter_modes) {
        if (static_cast<std::uint32_t>(entry.mode) == custom_mode) {
            return entry.name;
        }
    }
    return {};
}

void MessageBus::publish(const VehicleMessage& message) {
    {
        std::scoped_lock lock(mutex_);
        if (queue_messages_.size() >= capacity_) {
            queue_messages_.pop_front();
        }
        queue_messages_.push_back(message);
    }
    condition_.notify_one();
}

std::optional<VehicleMessage> MessageBus::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_messages_.empty()) {
        return std::nullopt;
    }
    VehicleMessage message = queue_messages_.front();
    queue_messages_.pop_front();
    return message;
}

std::optional<VehicleMessage> MessageBus::consume_for(Duration timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout, [this] { return !queue_messages_.empty(); })) {
        return std::nullopt;
    }
    VehicleMessage message = queue_messages_.front();
    queue_messages_.pop_front();
    return message;
}

void MessageBus::clear() {
    std::scoped_lock lock(mutex_);
    queue_messages_.clear();
}

Result<std::unique_ptr<VehicleLink>> open_vehicle_link(const FlightConfig& config) {
    const std::string_view connection = config.connection;
    if (connection == "sim" || connection.starts_with("sim://")) {
        SimulatedVehicleOptions options{};
        options.time_scale = config.sim_time_scale;
        return std::unique_ptr<VehicleLink>{std::make_unique<SimulatedVehicleLink>(options)};
    }
    get_logger()->error("No transport available for connection '{}'", connection);
    return make_error(
        ErrorKind::ConnectionFailure,
        "Unsupported connection '" + config.connection + "': only the simulated vehicle (sim://) is built in"
    );
}

}  // namespace drone_sentry
