// === Operator Commands =======================================================
//
// Inbound command channel. Envelopes carry a payload with an embedded
// timestamp, the operator id and secret, and an HMAC over the canonical
// payload. Verified commands are dispatched to the running mission; every
// decision is written to the audit log.

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include "drone_sentry/configuration.hpp"

namespace drone_sentry {

class AuditLog;
class CryptoEngine;
class MissionController;

/** @brief Result of handling one envelope. `reason` is "ok" when dispatched. */
struct CommandOutcome final {
    bool accepted{false};
    std::string command{};
    std::string reason{};
};

class OperatorCommandHandler final {
  public:
    OperatorCommandHandler(
        std::shared_ptr<const CryptoEngine> crypto,
        std::shared_ptr<AuditLog> audit,
        CommandConfig config = {}
    );

    /** @brief Route accepted commands to @p mission; null detaches. */
    void attach(std::shared_ptr<MissionController> mission);

    /**
     * @brief Verify and dispatch one envelope.
     *
     * `{"payload":{"command","timestamp",...},"operator_id","secret","hmac"}`.
     * Never throws on malformed input. Rejections are audited as
     * `command_rejected`, accepted commands as `command_received`.
     */
    [[nodiscard]] CommandOutcome handle(const nlohmann::json& envelope);

    /** @brief Parse @p text as JSON and handle it; unparseable text is `malformed_command`. */
    [[nodiscard]] CommandOutcome handle_text(std::string_view text);

  private:
    [[nodiscard]] CommandOutcome reject(const std::string& operator_id, const std::string& command, const std::string& reason);
    [[nodiscard]] std::string dispatch(const std::string& command);

    std::shared_ptr<const CryptoEngine> crypto_;
    std::shared_ptr<AuditLog> audit_;
    CommandConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::mutex mission_mutex_;
    std::shared_ptr<MissionController> mission_;
};

}  // namespace drone_sentry
