// === Vehicle Link ============================================================
//
// Abstract bidirectional telemetry/command link plus the typed protocol
// messages that travel over it. Message fields keep the wire units of the
// MAVLink common set (1e-7 degrees, millimetres, cm/s, centidegrees,
// millivolts) so a physical transport can map them one-to-one; the flight
// controller converts them into TelemetryState units.

#pragma once

#include <array>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "drone_sentry/configuration.hpp"
#include "drone_sentry/errors.hpp"
#include "drone_sentry/types.hpp"

namespace drone_sentry {

/** @brief MAV_CMD identifiers issued by the flight controller. */
enum class MavCommand : std::uint16_t {
    NavTakeoff = 22,
    DoChangeSpeed = 178,
    ComponentArmDisarm = 400,
};

/** @brief MAV_RESULT values carried by command acknowledgements. */
enum class MavResult : std::uint8_t {
    Accepted = 0,
    TemporarilyRejected = 1,
    Denied = 2,
    Unsupported = 3,
    Failed = 4,
    InProgress = 5,
};

/** @brief ArduCopter custom_mode numbers. */
enum class CopterMode : std::uint32_t {
    Stabilize = 0,
    Acro = 1,
    AltHold = 2,
    Auto = 3,
    Guided = 4,
    Loiter = 5,
    Rtl = 6,
    Circle = 7,
    Land = 9,
    Drift = 11,
    Sport = 13,
    Brake = 17,
    GuidedNoGps = 20,
    SmartRtl = 21,
};

/** @brief Case-insensitive lookup of a mode name such as "guided" or "RTL". */
[[nodiscard]] std::optional<CopterMode> parse_copter_mode(std::string_view name) noexcept;

/** @brief Upper-case mode name, or an empty view for numbers outside the table. */
[[nodiscard]] std::string_view copter_mode_name(std::uint32_t custom_mode) noexcept;

inline constexpr std::uint8_t k_mode_flag_safety_armed{0x80};   /**< MAV_MODE_FLAG_SAFETY_ARMED. */
inline constexpr std::uint8_t k_mode_flag_custom_mode{0x01};    /**< MAV_MODE_FLAG_CUSTOM_MODE_ENABLED. */

struct HeartbeatMessage final {
    std::uint32_t custom_mode{};
    std::uint8_t base_mode{};
    std::uint8_t system_status{};
};

struct GlobalPositionMessage final {
    std::int32_t lat_e7{};
    std::int32_t lon_e7{};
    std::int32_t alt_mm{};           /**< Above mean sea level. */
    std::int32_t relative_alt_mm{};  /**< Above home. */
    std::int16_t vx_cms{};
    std::int16_t vy_cms{};
    std::int16_t vz_cms{};
    std::uint16_t hdg_cdeg{};
};

struct GpsRawMessage final {
    std::uint8_t fix_type{};
    std::uint8_t satellites_visible{};
};

struct SystemStatusMessage final {
    std::uint16_t voltage_battery_mv{};
    std::int8_t battery_remaining{-1};  /**< Percent, -1 when unknown. */
};

struct AttitudeMessage final {
    float roll_rad{};
    float pitch_rad{};
    float yaw_rad{};
};

struct VfrHudMessage final {
    float groundspeed_mps{};
    float alt_m{};
};

struct CommandAckMessage final {
    MavCommand command{};
    MavResult result{MavResult::Accepted};
};

using VehicleMessage = std::variant<
    HeartbeatMessage,
    GlobalPositionMessage,
    GpsRawMessage,
    SystemStatusMessage,
    AttitudeMessage,
    VfrHudMessage,
    CommandAckMessage>;

/** @brief COMMAND_LONG with its seven float parameters. */
struct CommandLong final {
    MavCommand command{};
    std::array<float, 7> params{};
};

/** @brief SET_POSITION_TARGET_GLOBAL_INT restricted to a relative-altitude position. */
struct PositionTarget final {
    std::int32_t lat_e7{};
    std::int32_t lon_e7{};
    float relative_alt_m{};
};

/** @brief Thread-safe bounded FIFO used to hand link messages to the reader. */
class MessageBus final {
  public:
    explicit MessageBus(std::size_t capacity = 4096) : capacity_(capacity) {}

    /** @brief Publish a message; the oldest pending message is dropped when full. */
    void publish(const VehicleMessage& message);
    /** @brief Attempt to consume a pending message without blocking. */
    [[nodiscard]] std::optional<VehicleMessage> try_consume();
    /** @brief Wait up to @p timeout for a message. */
    [[nodiscard]] std::optional<VehicleMessage> consume_for(Duration timeout);
    void clear();

  private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<VehicleMessage> queue_messages_;
};

/**
 * @brief Transport-agnostic vehicle link.
 *
 * Implementations deliver inbound messages through receive() and accept
 * outbound commands through the send_* calls. A link never interprets
 * acknowledgements; matching commands to acks is the flight controller's job.
 */
class VehicleLink {
  public:
    virtual ~VehicleLink() = default;

    /** @brief Open the transport. Waiting for a heartbeat is left to the caller. */
    [[nodiscard]] virtual Status open() = 0;
    /** @brief Next inbound message; returns immediately when @p timeout is zero. */
    [[nodiscard]] virtual std::optional<VehicleMessage> receive(Duration timeout) = 0;
    virtual void send_set_mode(std::uint32_t custom_mode) = 0;
    virtual void send_command_long(const CommandLong& command) = 0;
    virtual void send_position_target(const PositionTarget& target) = 0;
    virtual void request_data_streams(int rate_hz) = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * @brief Build a link for @p connection.
 *
 * `sim` and `sim://` produce the in-process simulated vehicle; other schemes
 * are physical transports supplied outside this library and fail with
 * ConnectionFailure.
 */
[[nodiscard]] Result<std::unique_ptr<VehicleLink>> open_vehicle_link(const FlightConfig& config);

}  // namespace drone_sentry
