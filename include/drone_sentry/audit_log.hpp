// === Audit Log ===============================================================
//
// Append-only, tamper-evident record of every consequential action. Each
// entry is signed with the drone key and carries the content hash of its
// predecessor; appends are serialized through the data store's audit writer.

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "drone_sentry/errors.hpp"
#include "drone_sentry/models.hpp"

namespace drone_sentry {

class CryptoEngine;
class DataStore;
class IdGenerator;

/** @brief Result of replaying the chain. `count` is the entry total or the 1-based break index. */
struct ChainVerification final {
    bool valid{true};
    std::size_t count{0};
    std::string reason{};  /**< `prev_hash mismatch` or `invalid signature`; empty when valid. */

    /** @brief TamperDetected naming the broken entry, or success for an intact chain. */
    [[nodiscard]] Status to_status() const;
};

class AuditLog final {
  public:
    AuditLog(
        std::shared_ptr<DataStore> store,
        std::shared_ptr<const CryptoEngine> crypto,
        std::shared_ptr<IdGenerator> id_generator,
        std::string actor_id
    );

    /** @brief Append a signed entry chained to the current tip, recorded as this log's actor. */
    [[nodiscard]] Result<AuditEntry> log(const std::string& action, AuditDetails details = AuditDetails::object());

    /** @brief Append an entry on behalf of another actor (e.g. an operator issuing a command). */
    [[nodiscard]] Result<AuditEntry> log_as(
        const std::string& actor,
        const std::string& action,
        AuditDetails details = AuditDetails::object()
    );

    /**
     * @brief Replay all entries in creation order.
     *
     * Entry k (1-based) must reference the content hash of entry k-1 (empty
     * for k=1) and carry a valid signature over its own payload. The first
     * entry failing either check is reported as `{false, k}`; an intact chain
     * reports `{true, N}`.
     */
    [[nodiscard]] Result<ChainVerification> verify_chain() const;

    /** @brief Most recent entries first. */
    [[nodiscard]] Result<std::vector<AuditEntry>> get_recent(std::size_t limit = 50) const;

    [[nodiscard]] const std::string& actor_id() const noexcept { return str_actor_id_; }

  private:
    std::shared_ptr<DataStore> store_;
    std::shared_ptr<const CryptoEngine> crypto_;
    std::shared_ptr<IdGenerator> id_generator_;
    std::string str_actor_id_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_sentry
