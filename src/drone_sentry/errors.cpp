#include "drone_sentry/errors.hpp"

namespace drone_sentry {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotProvisioned:
            return "not_provisioned";
        case ErrorKind::AlreadyProvisioned:
            return "already_provisioned";
        case ErrorKind::ConnectionFailure:
            return "connection_failure";
        case ErrorKind::CommandRejected:
            return "command_rejected";
        case ErrorKind::AckTimeout:
            return "ack_timeout";
        case ErrorKind::ModeChangeUnconfirmed:
            return "mode_change_unconfirmed";
        case ErrorKind::InvalidSignature:
            return "invalid_signature";
        case ErrorKind::TamperDetected:
            return "tamper_detected";
        case ErrorKind::InvalidOperator:
            return "invalid_operator";
        case ErrorKind::CommandExpired:
            return "command_expired";
        case ErrorKind::PreflightFailure:
            return "preflight_failure";
        case ErrorKind::StoreFailure:
            return "store_failure";
        case ErrorKind::InvalidArgument:
            return "invalid_argument";
        case ErrorKind::IoFailure:
            return "io_failure";
        case ErrorKind::CryptoFailure:
            return "crypto_failure";
        case ErrorKind::InvalidTimestamp:
            return "invalid_timestamp";
    }
    return "unknown";
}

}  // namespace drone_sentry
