#include "drone_sentry/data_store.hpp"

#include <initializer_list>
#include <system_error>
#include <utility>
#include <variant>

#include <fmt/format.h>
#include <sqlite3.h>

#include "drone_sentry/logging.hpp"

namespace drone_sentry {

void SqliteConnectionDeleter::operator()(sqlite3* connection) const noexcept {
    sqlite3_close_v2(connection);
}

namespace {

constexpr int k_busy_timeout_ms{5000};

constexpr const char* k_schema = R"sql(
CREATE TABLE IF NOT EXISTS missions (
    id TEXT PRIMARY KEY,
    type TEXT NOT NULL,
    status TEXT NOT NULL DEFAULT 'idle',
    created_at TEXT NOT NULL,
    created_by TEXT NOT NULL,
    waypoints TEXT NOT NULL DEFAULT '[]',
    parameters TEXT NOT NULL DEFAULT '{}'
);

CREATE TABLE IF NOT EXISTS findings (
    id TEXT PRIMARY KEY,
    mission_id TEXT NOT NULL,
    timestamp TEXT NOT NULL,
    lat REAL NOT NULL,
    lon REAL NOT NULL,
    alt REAL NOT NULL,
    detection_class TEXT NOT NULL,
    confidence REAL NOT NULL,
    image_path TEXT,
    image_hash TEXT,
    signature TEXT,
    FOREIGN KEY (mission_id) REFERENCES missions(id)
);

CREATE TABLE IF NOT EXISTS audit_log (
    id TEXT PRIMARY KEY,
    timestamp TEXT NOT NULL,
    actor TEXT NOT NULL,
    action TEXT NOT NULL,
    details TEXT NOT NULL DEFAULT '{}',
    prev_hash TEXT NOT NULL,
    signature TEXT
);

CREATE INDEX IF NOT EXISTS idx_findings_mission ON findings(mission_id);
CREATE INDEX IF NOT EXISTS idx_findings_timestamp ON findings(timestamp);
CREATE INDEX IF NOT EXISTS idx_audit_timestamp ON audit_log(timestamp);
)sql";

constexpr std::string_view k_mission_columns{"id, type, status, created_at, created_by, waypoints, parameters"};
constexpr std::string_view k_finding_columns{
    "id, mission_id, timestamp, lat, lon, alt, detection_class, confidence, image_path, image_hash, signature"
};
constexpr std::string_view k_audit_columns{"id, timestamp, actor, action, details, prev_hash, signature"};

struct StatementDeleter final {
    void operator()(sqlite3_stmt* statement) const noexcept { sqlite3_finalize(statement); }
};
using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

using BindValue = std::variant<std::string_view, double, std::int64_t>;

Error store_error(sqlite3* connection, std::string_view context) {
    return make_error(ErrorKind::StoreFailure, fmt::format("{}: {}", context, sqlite3_errmsg(connection)));
}

Status exec(sqlite3* connection, const char* sql) {
    char* raw_message = nullptr;
    if (sqlite3_exec(connection, sql, nullptr, nullptr, &raw_message) != SQLITE_OK) {
        const std::string message = raw_message != nullptr ? raw_message : "unknown error";
        sqlite3_free(raw_message);
        return make_error(ErrorKind::StoreFailure, message);
    }
    return Status::success();
}

Result<StatementPtr> prepare(sqlite3* connection, const std::string& sql) {
    sqlite3_stmt* raw_statement = nullptr;
    if (sqlite3_prepare_v2(connection, sql.c_str(), static_cast<int>(sql.size()), &raw_statement, nullptr) != SQLITE_OK) {
        return store_error(connection, "prepare");
    }
    return StatementPtr{raw_statement};
}

Status bind_values(sqlite3* connection, sqlite3_stmt* statement, std::initializer_list<BindValue> values) {
    int index = 1;
    for (const BindValue& value : values) {
        int rc = SQLITE_OK;
        if (const auto* text = std::get_if<std::string_view>(&value)) {
            rc = sqlite3_bind_text(statement, index, text->data(), static_cast<int>(text->size()), SQLITE_TRANSIENT);
        } else if (const auto* real = std::get_if<double>(&value)) {
            rc = sqlite3_bind_double(statement, index, *real);
        } else {
            rc = sqlite3_bind_int64(statement, index, std::get<std::int64_t>(value));
        }
        if (rc != SQLITE_OK) {
            return store_error(connection, "bind");
        }
        ++index;
    }
    return Status::success();
}

Status step_done(sqlite3* connection, sqlite3_stmt* statement, std::string_view context) {
    if (sqlite3_step(statement) != SQLITE_DONE) {
        return store_error(connection, context);
    }
    return Status::success();
}

std::string column_text(sqlite3_stmt* statement, int column) {
    const unsigned char* text = sqlite3_column_text(statement, column);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(statement, column)));
}

Result<Mission> read_mission(sqlite3_stmt* statement) {
    Mission mission{};
    mission.id = column_text(statement, 0);
    mission.type = column_text(statement, 1);
    const auto status = parse_mission_status(column_text(statement, 2));
    if (!status) {
        return make_error(ErrorKind::StoreFailure, "Mission " + mission.id + " has an unknown status");
    }
    mission.status = *status;
    mission.created_at = column_text(statement, 3);
    mission.created_by = column_text(statement, 4);

    auto waypoints = parse_waypoints(nlohmann::json::parse(column_text(statement, 5), nullptr, false));
    auto parameters = parse_mission_parameters(nlohmann::json::parse(column_text(statement, 6), nullptr, false));
    if (!waypoints || !parameters) {
        return make_error(ErrorKind::StoreFailure, "Mission " + mission.id + " has malformed waypoints or parameters");
    }
    mission.waypoints = std::move(waypoints).value();
    mission.parameters = std::move(parameters).value();
    return mission;
}

Finding read_finding(sqlite3_stmt* statement) {
    Finding finding{};
    finding.id = column_text(statement, 0);
    finding.mission_id = column_text(statement, 1);
    finding.timestamp = column_text(statement, 2);
    finding.lat = sqlite3_column_double(statement, 3);
    finding.lon = sqlite3_column_double(statement, 4);
    finding.alt = sqlite3_column_double(statement, 5);
    finding.detection_class = column_text(statement, 6);
    finding.confidence = sqlite3_column_double(statement, 7);
    finding.image_path = column_text(statement, 8);
    finding.image_hash = column_text(statement, 9);
    finding.signature = column_text(statement, 10);
    return finding;
}

AuditEntry read_audit_entry(sqlite3_stmt* statement) {
    AuditEntry entry{};
    entry.id = column_text(statement, 0);
    entry.timestamp = column_text(statement, 1);
    entry.actor = column_text(statement, 2);
    entry.action = column_text(statement, 3);
    const std::string raw_details = column_text(statement, 4);
    entry.details = nlohmann::json::parse(raw_details, nullptr, false);
    if (entry.details.is_discarded()) {
        // Keep unparseable text verbatim so chain verification flags the row instead of erroring out.
        entry.details = raw_details;
    }
    entry.prev_hash = column_text(statement, 5);
    entry.signature = column_text(statement, 6);
    return entry;
}

Result<SqliteConnectionPtr> open_connection(const std::filesystem::path& db_path) {
    sqlite3* raw_connection = nullptr;
    const int rc = sqlite3_open_v2(
        db_path.string().c_str(),
        &raw_connection,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    SqliteConnectionPtr connection{raw_connection};
    if (rc != SQLITE_OK) {
        const std::string message = connection ? sqlite3_errmsg(connection.get()) : sqlite3_errstr(rc);
        return make_error(ErrorKind::StoreFailure, "Unable to open " + db_path.string() + ": " + message);
    }
    sqlite3_busy_timeout(connection.get(), k_busy_timeout_ms);
    for (const char* pragma : {"PRAGMA journal_mode=WAL;", "PRAGMA foreign_keys=ON;"}) {
        if (Status status = exec(connection.get(), pragma); !status) {
            return status.error();
        }
    }
    return connection;
}

/** @brief BEGIN IMMEDIATE scope that rolls back unless committed. */
class ImmediateTransaction final {
  public:
    explicit ImmediateTransaction(sqlite3* connection) : connection_(connection) {}

    ImmediateTransaction(const ImmediateTransaction&) = delete;
    ImmediateTransaction& operator=(const ImmediateTransaction&) = delete;

    ~ImmediateTransaction() {
        if (flag_open_) {
            sqlite3_exec(connection_, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    [[nodiscard]] Status begin() {
        Status status = exec(connection_, "BEGIN IMMEDIATE;");
        flag_open_ = status.ok();
        return status;
    }

    [[nodiscard]] Status commit() {
        Status status = exec(connection_, "COMMIT;");
        if (status.ok()) {
            flag_open_ = false;
        }
        return status;
    }

  private:
    sqlite3* connection_;
    bool flag_open_{false};
};

}  // namespace

DataStore::DataStore(
    std::filesystem::path db_path,
    SqliteConnectionPtr missions_connection,
    SqliteConnectionPtr findings_connection,
    SqliteConnectionPtr audit_connection
)
    : db_path_(std::move(db_path)),
      missions_connection_(std::move(missions_connection)),
      findings_connection_(std::move(findings_connection)),
      audit_connection_(std::move(audit_connection)),
      logger_(get_logger()) {}

Result<std::unique_ptr<DataStore>> DataStore::open(const std::filesystem::path& db_path) {
    if (db_path.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(db_path.parent_path(), error);
        if (error) {
            return make_error(ErrorKind::StoreFailure, "Unable to create " + db_path.parent_path().string());
        }
    }

    auto missions_connection = open_connection(db_path);
    if (!missions_connection) {
        return missions_connection.error();
    }
    if (Status status = exec(missions_connection.value().get(), k_schema); !status) {
        return status.error();
    }
    auto findings_connection = open_connection(db_path);
    if (!findings_connection) {
        return findings_connection.error();
    }
    auto audit_connection = open_connection(db_path);
    if (!audit_connection) {
        return audit_connection.error();
    }

    std::unique_ptr<DataStore> store{new DataStore(
        db_path,
        std::move(missions_connection).value(),
        std::move(findings_connection).value(),
        std::move(audit_connection).value()
    )};
    store->logger_->debug("Opened data store at {}", db_path.string());
    return store;
}

// Missions

Status DataStore::save_mission(const Mission& mission) {
    std::scoped_lock lock(missions_mutex_);
    auto statement = prepare(
        missions_connection_.get(),
        fmt::format(
            "INSERT INTO missions ({}) VALUES (?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET type = excluded.type, status = excluded.status, "
            "created_at = excluded.created_at, created_by = excluded.created_by, "
            "waypoints = excluded.waypoints, parameters = excluded.parameters",
            k_mission_columns
        )
    );
    if (!statement) {
        return statement.error();
    }
    const std::string str_waypoints = nlohmann::json(mission.waypoints).dump();
    const std::string str_parameters = nlohmann::json(mission.parameters).dump();
    if (Status status = bind_values(
            missions_connection_.get(),
            statement.value().get(),
            {mission.id, mission.type, to_string(mission.status), mission.created_at, mission.created_by, str_waypoints, str_parameters}
        );
        !status) {
        return status;
    }
    return step_done(missions_connection_.get(), statement.value().get(), "save_mission");
}

Result<std::optional<Mission>> DataStore::get_mission(std::string_view mission_id) {
    std::scoped_lock lock(missions_mutex_);
    auto statement = prepare(missions_connection_.get(), fmt::format("SELECT {} FROM missions WHERE id = ?", k_mission_columns));
    if (!statement) {
        return statement.error();
    }
    if (Status status = bind_values(missions_connection_.get(), statement.value().get(), {mission_id}); !status) {
        return status.error();
    }
    const int rc = sqlite3_step(statement.value().get());
    if (rc == SQLITE_DONE) {
        return std::optional<Mission>{};
    }
    if (rc != SQLITE_ROW) {
        return store_error(missions_connection_.get(), "get_mission");
    }
    auto mission = read_mission(statement.value().get());
    if (!mission) {
        return mission.error();
    }
    return std::optional<Mission>{std::move(mission).value()};
}

Status DataStore::update_mission_status(std::string_view mission_id, MissionStatus status) {
    std::scoped_lock lock(missions_mutex_);
    auto statement = prepare(missions_connection_.get(), "UPDATE missions SET status = ? WHERE id = ?");
    if (!statement) {
        return statement.error();
    }
    if (Status bound = bind_values(missions_connection_.get(), statement.value().get(), {to_string(status), mission_id}); !bound) {
        return bound;
    }
    if (Status stepped = step_done(missions_connection_.get(), statement.value().get(), "update_mission_status"); !stepped) {
        return stepped;
    }
    if (sqlite3_changes(missions_connection_.get()) == 0) {
        return make_error(ErrorKind::StoreFailure, fmt::format("Unknown mission {}", mission_id));
    }
    return Status::success();
}

Result<std::vector<Mission>> DataStore::list_missions(std::optional<MissionStatus> status) {
    std::scoped_lock lock(missions_mutex_);
    const std::string sql = status
        ? fmt::format("SELECT {} FROM missions WHERE status = ? ORDER BY created_at DESC, rowid DESC", k_mission_columns)
        : fmt::format("SELECT {} FROM missions ORDER BY created_at DESC, rowid DESC", k_mission_columns);
    auto statement = prepare(missions_connection_.get(), sql);
    if (!statement) {
        return statement.error();
    }
    if (status) {
        if (Status bound = bind_values(missions_connection_.get(), statement.value().get(), {to_string(*status)}); !bound) {
            return bound.error();
        }
    }

    std::vector<Mission> list_missions;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(statement.value().get())) == SQLITE_ROW) {
        auto mission = read_mission(statement.value().get());
        if (!mission) {
            return mission.error();
        }
        list_missions.push_back(std::move(mission).value());
    }
    if (rc != SQLITE_DONE) {
        return store_error(missions_connection_.get(), "list_missions");
    }
    return list_missions;
}

// Findings

Status DataStore::save_finding(const Finding& finding) {
    std::scoped_lock lock(findings_mutex_);
    auto statement = prepare(
        findings_connection_.get(),
        fmt::format("INSERT INTO findings ({}) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", k_finding_columns)
    );
    if (!statement) {
        return statement.error();
    }
    if (Status status = bind_values(
            findings_connection_.get(),
            statement.value().get(),
            {finding.id,
             finding.mission_id,
             finding.timestamp,
             finding.lat,
             finding.lon,
             finding.alt,
             finding.detection_class,
             finding.confidence,
             finding.image_path,
             finding.image_hash,
             finding.signature}
        );
        !status) {
        return status;
    }
    return step_done(findings_connection_.get(), statement.value().get(), "save_finding");
}

Result<std::optional<Finding>> DataStore::get_finding(std::string_view finding_id) {
    std::scoped_lock lock(findings_mutex_);
    auto statement = prepare(findings_connection_.get(), fmt::format("SELECT {} FROM findings WHERE id = ?", k_finding_columns));
    if (!statement) {
        return statement.error();
    }
    if (Status status = bind_values(findings_connection_.get(), statement.value().get(), {finding_id}); !status) {
        return status.error();
    }
    const int rc = sqlite3_step(statement.value().get());
    if (rc == SQLITE_DONE) {
        return std::optional<Finding>{};
    }
    if (rc != SQLITE_ROW) {
        return store_error(findings_connection_.get(), "get_finding");
    }
    return std::optional<Finding>{read_finding(statement.value().get())};
}

Result<std::vector<Finding>> DataStore::get_findings(std::string_view mission_id) {
    std::scoped_lock lock(findings_mutex_);
    auto statement = prepare(
        findings_connection_.get(),
        fmt::format("SELECT {} FROM findings WHERE mission_id = ? ORDER BY timestamp, rowid", k_finding_columns)
    );
    if (!statement) {
        return statement.error();
    }
    if (Status status = bind_values(findings_connection_.get(), statement.value().get(), {mission_id}); !status) {
        return status.error();
    }
    std::vector<Finding> list_findings;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(statement.value().get())) == SQLITE_ROW) {
        list_findings.push_back(read_finding(statement.value().get()));
    }
    if (rc != SQLITE_DONE) {
        return store_error(findings_connection_.get(), "get_findings");
    }
    return list_findings;
}

Result<std::int64_t> DataStore::get_finding_count(std::string_view mission_id) {
    std::scoped_lock lock(findings_mutex_);
    auto statement = prepare(findings_connection_.get(), "SELECT COUNT(*) FROM findings WHERE mission_id = ?");
    if (!statement) {
        return statement.error();
    }
    if (Status status = bind_values(findings_connection_.get(), statement.value().get(), {mission_id}); !status) {
        return status.error();
    }
    if (sqlite3_step(statement.value().get()) != SQLITE_ROW) {
        return store_error(findings_connection_.get(), "get_finding_count");
    }
    return static_cast<std::int64_t>(sqlite3_column_int64(statement.value().get(), 0));
}

// Audit log

Result<AuditEntry> DataStore::append_audit(const AuditEntryBuilder& builder) {
    std::scoped_lock lock(audit_mutex_);
    sqlite3* connection = audit_connection_.get();

    ImmediateTransaction transaction(connection);
    if (Status status = transaction.begin(); !status) {
        return status.error();
    }

    auto tip = prepare(connection, fmt::format("SELECT {} FROM audit_log ORDER BY rowid DESC LIMIT 1", k_audit_columns));
    if (!tip) {
        return tip.error();
    }
    std::string prev_hash;
    const int rc = sqlite3_step(tip.value().get());
    if (rc == SQLITE_ROW) {
        prev_hash = read_audit_entry(tip.value().get()).content_hash();
    } else if (rc != SQLITE_DONE) {
        return store_error(connection, "audit tip");
    }
    tip.value().reset();

    auto entry = builder(prev_hash);
    if (!entry) {
        return entry.error();
    }
    const AuditEntry& built = entry.value();
    if (built.prev_hash != prev_hash) {
        return make_error(ErrorKind::StoreFailure, "Audit entry does not extend the current chain tip");
    }

    auto insert = prepare(
        connection,
        fmt::format("INSERT INTO audit_log ({}) VALUES (?, ?, ?, ?, ?, ?, ?)", k_audit_columns)
    );
    if (!insert) {
        return insert.error();
    }
    const std::string str_details = built.canonical_details();
    if (Status status = bind_values(
            connection,
            insert.value().get(),
            {built.id, built.timestamp, built.actor, built.action, str_details, built.prev_hash, built.signature}
        );
        !status) {
        return status.error();
    }
    if (Status status = step_done(connection, insert.value().get(), "append_audit"); !status) {
        return status.error();
    }
    insert.value().reset();

    if (Status status = transaction.commit(); !status) {
        return status.error();
    }
    return entry;
}

Result<std::string> DataStore::last_audit_hash() {
    std::scoped_lock lock(audit_mutex_);
    sqlite3* connection = audit_connection_.get();
    auto statement = prepare(connection, fmt::format("SELECT {} FROM audit_log ORDER BY rowid DESC LIMIT 1", k_audit_columns));
    if (!statement) {
        return statement.error();
    }
    const int rc = sqlite3_step(statement.value().get());
    if (rc == SQLITE_DONE) {
        return std::string{};
    }
    if (rc != SQLITE_ROW) {
        return store_error(connection, "last_audit_hash");
    }
    return read_audit_entry(statement.value().get()).content_hash();
}

Result<std::vector<AuditEntry>> DataStore::get_audit_log(std::size_t limit) {
    std::scoped_lock lock(audit_mutex_);
    sqlite3* connection = audit_connection_.get();
    auto statement = prepare(connection, fmt::format("SELECT {} FROM audit_log ORDER BY rowid DESC LIMIT ?", k_audit_columns));
    if (!statement) {
        return statement.error();
    }
    if (Status status = bind_values(connection, statement.value().get(), {static_cast<std::int64_t>(limit)}); !status) {
        return status.error();
    }
    std::vector<AuditEntry> list_entries;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(statement.value().get())) == SQLITE_ROW) {
        list_entries.push_back(read_audit_entry(statement.value().get()));
    }
    if (rc != SQLITE_DONE) {
        return store_error(connection, "get_audit_log");
    }
    return list_entries;
}

Result<std::vector<AuditEntry>> DataStore::all_audit_entries() {
    std::scoped_lock lock(audit_mutex_);
    sqlite3* connection = audit_connection_.get();
    auto statement = prepare(connection, fmt::format("SELECT {} FROM audit_log ORDER BY rowid ASC", k_audit_columns));
    if (!statement) {
        return statement.error();
    }
    std::vector<AuditEntry> list_entries;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(statement.value().get())) == SQLITE_ROW) {
        list_entries.push_back(read_audit_entry(statement.value().get()));
    }
    if (rc != SQLITE_DONE) {
        return store_error(connection, "all_audit_entries");
    }
    return list_entries;
}

}  // namespace drone_sentry
