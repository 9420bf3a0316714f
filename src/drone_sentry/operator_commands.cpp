#include "drone_sentry/operator_commands.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <utility>

#include "drone_sentry/audit_log.hpp"
#include "drone_sentry/crypto_engine.hpp"
#include "drone_sentry/logging.hpp"
#include "drone_sentry/mission_controller.hpp"

namespace drone_sentry {

namespace {

constexpr std::array<std::string_view, 3> k_supported_commands{"pause", "resume", "abort"};

std::string string_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return {};
    }
    const auto field = object.find(key);
    if (field == object.end() || !field->is_string()) {
        return {};
    }
    return field->get<std::string>();
}

}  // namespace

OperatorCommandHandler::OperatorCommandHandler(
    std::shared_ptr<const CryptoEngine> crypto,
    std::shared_ptr<AuditLog> audit,
    CommandConfig config
)
    : crypto_(std::move(crypto)),
      audit_(std::move(audit)),
      config_(config),
      logger_(get_logger()) {
    if (!crypto_ || !audit_) {
        throw std::invalid_argument("OperatorCommandHandler requires a crypto engine and audit log");
    }
}

void OperatorCommandHandler::attach(std::shared_ptr<MissionController> mission) {
    std::scoped_lock lock(mission_mutex_);
    mission_ = std::move(mission);
}

CommandOutcome OperatorCommandHandler::handle_text(std::string_view text) {
    const nlohmann::json envelope = nlohmann::json::parse(std::string{text}, nullptr, false);
    if (envelope.is_discarded()) {
        return reject("unknown", "", "malformed_command");
    }
    return handle(envelope);
}

CommandOutcome OperatorCommandHandler::handle(const nlohmann::json& envelope) {
    const std::string operator_id = string_field(envelope, "operator_id");
    const std::string secret = string_field(envelope, "secret");
    const std::string provided_mac = string_field(envelope, "hmac");
    const nlohmann::json payload = envelope.is_object() && envelope.contains("payload") ? envelope.at("payload") : nlohmann::json{};
    const std::string command = string_field(payload, "command");

    if (operator_id.empty() || secret.empty() || provided_mac.empty() || !payload.is_object() || command.empty()) {
        return reject(operator_id.empty() ? "unknown" : operator_id, command, "malformed_command");
    }

    const CommandVerdict verdict = crypto_->verify_command(payload, operator_id, secret, provided_mac, config_.max_command_age);
    if (!verdict.accepted) {
        return reject(operator_id, command, verdict.reason);
    }

    if (std::find(k_supported_commands.begin(), k_supported_commands.end(), command) == k_supported_commands.end()) {
        return reject(operator_id, command, "unknown_command");
    }

    if (Result<AuditEntry> entry = audit_->log_as(operator_id, "command_received", {{"operator_id", operator_id}, {"command", command}});
        !entry) {
        logger_->error("Audit append failed for command_received: {}", entry.error().message);
    }
    logger_->info("Operator {} issued {}", operator_id, command);

    const std::string reason = dispatch(command);
    if (reason != "ok") {
        logger_->warn("Command {} from {} not applied: {}", command, operator_id, reason);
        if (Result<AuditEntry> entry = audit_->log("command_failed", {{"operator_id", operator_id}, {"command", command}, {"reason", reason}});
            !entry) {
            logger_->error("Audit append failed for command_failed: {}", entry.error().message);
        }
    }
    return CommandOutcome{true, command, reason};
}

CommandOutcome OperatorCommandHandler::reject(
    const std::string& operator_id,
    const std::string& command,
    const std::string& reason
) {
    logger_->warn("Command rejected from {}: {}", operator_id, reason);
    AuditDetails details{{"operator_id", operator_id}, {"reason", reason}};
    if (!command.empty()) {
        details["command"] = command;
    }
    if (Result<AuditEntry> entry = audit_->log("command_rejected", std::move(details)); !entry) {
        logger_->error("Audit append failed for command_rejected: {}", entry.error().message);
    }
    return CommandOutcome{false, command, reason};
}

std::string OperatorCommandHandler::dispatch(const std::string& command) {
    std::shared_ptr<MissionController> mission;
    {
        std::scoped_lock lock(mission_mutex_);
        mission = mission_;
    }
    if (!mission) {
        return "no_active_mission";
    }

    Status applied;
    if (command == "pause") {
        applied = mission->pause();
    } else if (command == "resume") {
        applied = mission->resume();
    } else {
        applied = mission->abort("operator_command");
    }
    if (!applied) {
        return std::string{to_string(applied.kind())};
    }
    return "ok";
}

}  // namespace drone_sentry
