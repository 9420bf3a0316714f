// === Data Store ==============================================================
//
// SQLite-backed local persistence for missions, findings and the audit log.
// Every write is committed before the call returns, so subsequent reads see
// it immediately. Missions, findings and the audit log each own a serialized
// connection guarded by their own lock, so per-connection state such as the
// change count or the last error always belongs to that entity's statement.
// Audit appends run inside `BEGIN IMMEDIATE` so reading the chain tip and
// inserting the next link is atomic across threads and processes. No code
// path updates or deletes audit rows.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "drone_sentry/errors.hpp"
#include "drone_sentry/models.hpp"

struct sqlite3;

namespace drone_sentry {

struct SqliteConnectionDeleter final {
    void operator()(sqlite3* connection) const noexcept;
};
using SqliteConnectionPtr = std::unique_ptr<sqlite3, SqliteConnectionDeleter>;

class DataStore final {
  public:
    /** @brief Builds the next audit entry once the current chain tip is known. */
    using AuditEntryBuilder = std::function<Result<AuditEntry>(const std::string& prev_hash)>;

    /** @brief Open (creating if needed) the database at @p db_path and apply the schema. */
    [[nodiscard]] static Result<std::unique_ptr<DataStore>> open(const std::filesystem::path& db_path);

    DataStore(const DataStore&) = delete;
    DataStore& operator=(const DataStore&) = delete;

    // Missions
    [[nodiscard]] Status save_mission(const Mission& mission);
    [[nodiscard]] Result<std::optional<Mission>> get_mission(std::string_view mission_id);
    [[nodiscard]] Status update_mission_status(std::string_view mission_id, MissionStatus status);
    /** @brief Newest first, optionally filtered by status. */
    [[nodiscard]] Result<std::vector<Mission>> list_missions(std::optional<MissionStatus> status = std::nullopt);

    // Findings
    [[nodiscard]] Status save_finding(const Finding& finding);
    [[nodiscard]] Result<std::optional<Finding>> get_finding(std::string_view finding_id);
    /** @brief Findings of one mission ordered by timestamp. */
    [[nodiscard]] Result<std::vector<Finding>> get_findings(std::string_view mission_id);
    [[nodiscard]] Result<std::int64_t> get_finding_count(std::string_view mission_id);

    // Audit log
    /**
     * @brief Append one audit entry atomically with respect to the chain tip.
     *
     * @p builder receives the content hash of the current last entry (empty
     * for genesis) and returns the signed entry to insert. A builder error
     * rolls the transaction back and is returned unchanged.
     */
    [[nodiscard]] Result<AuditEntry> append_audit(const AuditEntryBuilder& builder);
    /** @brief Content hash of the last appended entry, or empty when the log is empty. */
    [[nodiscard]] Result<std::string> last_audit_hash();
    /** @brief Most recent entries first. */
    [[nodiscard]] Result<std::vector<AuditEntry>> get_audit_log(std::size_t limit);
    /** @brief Every entry in creation order. */
    [[nodiscard]] Result<std::vector<AuditEntry>> all_audit_entries();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return db_path_; }

  private:
    DataStore(
        std::filesystem::path db_path,
        SqliteConnectionPtr missions_connection,
        SqliteConnectionPtr findings_connection,
        SqliteConnectionPtr audit_connection
    );

    std::filesystem::path db_path_;
    SqliteConnectionPtr missions_connection_;
    SqliteConnectionPtr findings_connection_;
    SqliteConnectionPtr audit_connection_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex missions_mutex_;
    std::mutex findings_mutex_;
    std::mutex audit_mutex_;
};

}  // namespace drone_sentry
