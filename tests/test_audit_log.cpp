#include <catch2/catch.hpp>

#include <string>
#include <thread>
#include <vector>

#include <sqlite3.h>

#include "drone_sentry/audit_log.hpp"
#include "logging_test_fixture.hpp"
#include "test_workspace.hpp"

using namespace drone_sentry;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_sentry::test::ensure_logger_initialized();
    return true;
}();

/** @brief Edit the database behind the store's back, as an attacker with file access would. */
void tamper(const std::filesystem::path& db_path, const std::string& sql) {
    sqlite3* connection = nullptr;
    REQUIRE(sqlite3_open(db_path.string().c_str(), &connection) == SQLITE_OK);
    char* message = nullptr;
    const int rc = sqlite3_exec(connection, sql.c_str(), nullptr, nullptr, &message);
    sqlite3_free(message);
    sqlite3_close(connection);
    REQUIRE(rc == SQLITE_OK);
}

std::vector<AuditEntry> append_entries(AuditLog& audit, int count) {
    std::vector<AuditEntry> list_entries;
    for (int index = 0; index < count; ++index) {
        auto entry = audit.log("waypoint_navigate", {{"waypoint_index", index}});
        REQUIRE(entry.ok());
        list_entries.push_back(entry.value());
    }
    return list_entries;
}
}  // namespace

TEST_CASE("Empty audit log verifies as valid") {
    drone_sentry::test::ProvisionedDrone drone{};
    const auto verification = drone.audit->verify_chain();
    REQUIRE(verification.ok());
    REQUIRE(verification.value().valid);
    REQUIRE(verification.value().count == 0);
    REQUIRE(verification.value().to_status().ok());
}

TEST_CASE("Audit entries are signed and chained") {
    drone_sentry::test::ProvisionedDrone drone{};
    const auto list_entries = append_entries(*drone.audit, 5);

    REQUIRE(list_entries.front().prev_hash.empty());
    REQUIRE(list_entries.front().actor == drone.identity->drone_id());
    for (std::size_t index = 1; index < list_entries.size(); ++index) {
        REQUIRE(list_entries[index].prev_hash == list_entries[index - 1].content_hash());
    }
    REQUIRE(drone.crypto->verify_signature(list_entries[2].signable_payload(), list_entries[2].signature));

    const auto verification = drone.audit->verify_chain();
    REQUIRE(verification.value().valid);
    REQUIRE(verification.value().count == 5);
}

TEST_CASE("Entries logged for another actor keep that actor") {
    drone_sentry::test::ProvisionedDrone drone{};
    const auto entry = drone.audit->log_as("operator-7", "command_received", {{"command", "pause"}});
    REQUIRE(entry.ok());
    REQUIRE(entry.value().actor == "operator-7");
    REQUIRE(drone.audit->verify_chain().value().valid);
}

TEST_CASE("Editing any stored field breaks the chain at that entry") {
    drone_sentry::test::ProvisionedDrone drone{};
    const auto list_entries = append_entries(*drone.audit, 6);
    const std::string fourth = "' WHERE id = '" + list_entries[3].id + "'";

    SECTION("action") {
        tamper(drone.store->path(), "UPDATE audit_log SET action = 'mission_resumed" + fourth);
    }
    SECTION("details") {
        tamper(drone.store->path(), "UPDATE audit_log SET details = '{\"waypoint_index\":99}" + fourth);
    }
    SECTION("timestamp") {
        tamper(drone.store->path(), "UPDATE audit_log SET timestamp = '2020-01-01T00:00:00.000000+00:00" + fourth);
    }
    SECTION("actor") {
        tamper(drone.store->path(), "UPDATE audit_log SET actor = 'intruder" + fourth);
    }
    SECTION("prev_hash") {
        tamper(drone.store->path(), "UPDATE audit_log SET prev_hash = '" + list_entries[1].content_hash() + fourth);
    }
    SECTION("signature") {
        tamper(drone.store->path(), "UPDATE audit_log SET signature = '" + list_entries[2].signature + fourth);
    }

    const auto verification = drone.audit->verify_chain();
    REQUIRE(verification.ok());
    REQUIRE_FALSE(verification.value().valid);
    REQUIRE(verification.value().count == 4);

    const Status intact = verification.value().to_status();
    REQUIRE(intact.kind() == ErrorKind::TamperDetected);
    REQUIRE(intact.error().message.find("entry 4") != std::string::npos);
}

TEST_CASE("Editing the newest entry is caught by its signature") {
    drone_sentry::test::ProvisionedDrone drone{};
    const auto list_entries = append_entries(*drone.audit, 3);

    tamper(drone.store->path(), "UPDATE audit_log SET action = 'mission_complete' WHERE id = '" + list_entries[2].id + "'");

    const auto verification = drone.audit->verify_chain();
    REQUIRE_FALSE(verification.value().valid);
    REQUIRE(verification.value().count == 3);
    REQUIRE(verification.value().reason == "invalid signature");
}

TEST_CASE("Deleting an entry breaks the chain at its successor") {
    drone_sentry::test::ProvisionedDrone drone{};
    const auto list_entries = append_entries(*drone.audit, 4);

    tamper(drone.store->path(), "DELETE FROM audit_log WHERE id = '" + list_entries[1].id + "'");

    const auto verification = drone.audit->verify_chain();
    REQUIRE_FALSE(verification.value().valid);
    REQUIRE(verification.value().count == 2);
    REQUIRE(verification.value().reason == "prev_hash mismatch");
}

TEST_CASE("Concurrent appends keep a single linear chain") {
    drone_sentry::test::ProvisionedDrone drone{};
    std::vector<std::thread> writers;
    for (int writer = 0; writer < 4; ++writer) {
        writers.emplace_back([&drone, writer] {
            for (int index = 0; index < 10; ++index) {
                const auto entry = drone.audit->log("detection", {{"writer", writer}, {"index", index}});
                (void)entry;
            }
        });
    }
    for (auto& thread : writers) {
        thread.join();
    }

    const auto verification = drone.audit->verify_chain();
    REQUIRE(verification.value().valid);
    REQUIRE(verification.value().count == 40);
}

TEST_CASE("Recent entries come back newest first") {
    drone_sentry::test::ProvisionedDrone drone{};
    REQUIRE(drone.audit->log("first").ok());
    REQUIRE(drone.audit->log("second").ok());
    REQUIRE(drone.audit->log("third").ok());

    const auto recent = drone.audit->get_recent(2);
    REQUIRE(recent.ok());
    REQUIRE(recent.value().size() == 2);
    REQUIRE(recent.value()[0].action == "third");
    REQUIRE(recent.value()[1].action == "second");
}
