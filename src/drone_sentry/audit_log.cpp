#include "drone_sentry/audit_log.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "drone_sentry/crypto_engine.hpp"
#include "drone_sentry/data_store.hpp"
#include "drone_sentry/id_generator.hpp"
#include "drone_sentry/logging.hpp"
#include "drone_sentry/timestamp.hpp"

namespace drone_sentry {

Status ChainVerification::to_status() const {
    if (valid) {
        return Status::success();
    }
    return make_error(ErrorKind::TamperDetected, fmt::format("Audit chain broken at entry {}: {}", count, reason));
}

AuditLog::AuditLog(
    std::shared_ptr<DataStore> store,
    std::shared_ptr<const CryptoEngine> crypto,
    std::shared_ptr<IdGenerator> id_generator,
    std::string actor_id
)
    : store_(std::move(store)),
      crypto_(std::move(crypto)),
      id_generator_(std::move(id_generator)),
      str_actor_id_(std::move(actor_id)),
      logger_(get_logger()) {
    if (!store_ || !crypto_ || !id_generator_) {
        throw std::invalid_argument("AuditLog requires a data store, crypto engine and id generator");
    }
}

Result<AuditEntry> AuditLog::log(const std::string& action, AuditDetails details) {
    return log_as(str_actor_id_, action, std::move(details));
}

Result<AuditEntry> AuditLog::log_as(const std::string& actor, const std::string& action, AuditDetails details) {
    if (!details.is_object()) {
        return make_error(ErrorKind::InvalidArgument, "Audit details must be a JSON object");
    }

    auto appended = store_->append_audit([&](const std::string& prev_hash) -> Result<AuditEntry> {
        AuditEntry entry{};
        entry.id = id_generator_->next();
        entry.timestamp = now_iso8601();
        entry.actor = actor;
        entry.action = action;
        entry.details = details;
        entry.prev_hash = prev_hash;

        auto signature = crypto_->sign_data(entry.signable_payload());
        if (!signature) {
            return signature.error();
        }
        entry.signature = std::move(signature).value();
        return entry;
    });

    if (!appended) {
        logger_->error("Audit append failed for {}: {}", action, appended.error().message);
        return appended;
    }
    logger_->debug("Audit: {} | {} | {}", action, actor, appended.value().id);
    return appended;
}

Result<ChainVerification> AuditLog::verify_chain() const {
    auto entries = store_->all_audit_entries();
    if (!entries) {
        return entries.error();
    }

    std::string expected_prev_hash;
    std::size_t position = 0;
    for (const AuditEntry& entry : entries.value()) {
        ++position;
        if (entry.prev_hash != expected_prev_hash) {
            logger_->error("Audit chain broken at entry {} ({}): prev_hash mismatch", position, entry.id);
            return ChainVerification{false, position, "prev_hash mismatch"};
        }
        if (!crypto_->verify_signature(entry.signable_payload(), entry.signature)) {
            logger_->error("Audit chain broken at entry {} ({}): invalid signature", position, entry.id);
            return ChainVerification{false, position, "invalid signature"};
        }
        expected_prev_hash = entry.content_hash();
    }
    logger_->info("Audit chain intact ({} entries)", position);
    return ChainVerification{true, position, {}};
}

Result<std::vector<AuditEntry>> AuditLog::get_recent(std::size_t limit) const {
    return store_->get_audit_log(limit);
}

}  // namespace drone_sentry
