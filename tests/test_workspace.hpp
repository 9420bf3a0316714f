#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include "drone_sentry/audit_log.hpp"
#include "drone_sentry/crypto_engine.hpp"
#include "drone_sentry/data_store.hpp"
#include "drone_sentry/drone_identity.hpp"
#include "drone_sentry/id_generator.hpp"

namespace drone_sentry::test {

/** @brief Unique directory under the system temp dir, removed on destruction. */
class TemporaryDirectory final {
  public:
    TemporaryDirectory() {
        static IdGenerator id_generator{};
        path_ = std::filesystem::temp_directory_path() / ("drone_sentry_test_" + id_generator.next());
        std::filesystem::create_directories(path_);
    }

    ~TemporaryDirectory() {
        std::error_code error;
        std::filesystem::remove_all(path_, error);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /** @brief Write @p content to @p relative and return the absolute path. */
    std::filesystem::path write(const std::filesystem::path& relative, const std::string& content) const {
        const auto file_path = path_ / relative;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream stream(file_path, std::ios::binary | std::ios::trunc);
        stream << content;
        return file_path;
    }

  private:
    std::filesystem::path path_;
};

/**
 * @brief Provisioned identity with its crypto engine, store and audit log.
 *
 * The hardware fingerprint reads from a fixture system root so tests never
 * depend on the host's machine id or network interfaces.
 */
struct ProvisionedDrone final {
    TemporaryDirectory workspace{};
    std::shared_ptr<IdGenerator> id_generator{std::make_shared<IdGenerator>()};
    std::shared_ptr<DroneIdentity> identity{};
    ProvisionResult provisioned{};
    std::shared_ptr<CryptoEngine> crypto{};
    std::shared_ptr<DataStore> store{};
    std::shared_ptr<AuditLog> audit{};

    ProvisionedDrone() {
        workspace.write("system/etc/machine-id", "0123456789abcdef0123456789abcdef\n");
        workspace.write("system/sys/class/net/eth0/address", "02:00:00:aa:bb:cc\n");

        auto opened = DroneIdentity::open(workspace.path() / "identity", id_generator, workspace.path() / "system");
        if (!opened) {
            throw std::runtime_error("identity open failed: " + opened.error().message);
        }
        identity = std::move(opened).value();
        auto result = identity->provision("test-org");
        if (!result) {
            throw std::runtime_error("provision failed: " + result.error().message);
        }
        provisioned = std::move(result).value();
        crypto = std::make_shared<CryptoEngine>(identity);

        auto opened_store = DataStore::open(workspace.path() / "sentry.db");
        if (!opened_store) {
            throw std::runtime_error("store open failed: " + opened_store.error().message);
        }
        store = std::shared_ptr<DataStore>(std::move(opened_store).value());
        audit = std::make_shared<AuditLog>(store, crypto, id_generator, identity->drone_id());
    }
};

}  // namespace drone_sentry::test
