// === Drone Identity ==========================================================
//
// Owns the device-bound Ed25519 keypair, the hardware fingerprint, the
// organisation binding and the operator credential map. Identity material is
// created once by provision() and loaded from the identity directory on every
// later start; the private key never leaves the device.
//
// Directory layout: drone_id, drone_key.pem (0600, PKCS#8), drone_key_pub.pem,
// hardware_fingerprint, org_id, operators.json (0600).

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>

#include <openssl/evp.h>
#include <spdlog/logger.h>

#include "drone_sentry/digest.hpp"
#include "drone_sentry/errors.hpp"

namespace drone_sentry {

class IdGenerator;

/** @brief Public identity details returned once by provision(). */
struct ProvisionResult final {
    std::string drone_id{};
    std::string org_id{};
    std::string public_key_pem{};
    std::string hardware_fingerprint{};
    std::string operator_id{};
    std::string operator_secret{};   /**< Shown once; only a salted hash is persisted. */
};

struct PrivateKeyDeleter final {
    void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};
using PrivateKeyPtr = std::unique_ptr<EVP_PKEY, PrivateKeyDeleter>;

class DroneIdentity final {
  public:
    /**
     * @brief Open the identity stored in @p identity_dir.
     *
     * A missing directory or missing drone_id yields an unprovisioned identity.
     * Corrupt key material is reported as an error rather than silently
     * replaced.
     *
     * @param system_root Prefix for /proc, /etc and /sys lookups used by the
     *        hardware fingerprint; tests point this at a fixture tree.
     */
    [[nodiscard]] static Result<std::shared_ptr<DroneIdentity>> open(
        std::filesystem::path identity_dir,
        std::shared_ptr<IdGenerator> id_generator,
        std::filesystem::path system_root = "/"
    );

    DroneIdentity(const DroneIdentity&) = delete;
    DroneIdentity& operator=(const DroneIdentity&) = delete;

    /** @brief Generate and persist a new identity; fails if one already exists. */
    [[nodiscard]] Result<ProvisionResult> provision(const std::string& org_id);

    /** @brief Register an additional operator credential. */
    [[nodiscard]] Status add_operator(const std::string& operator_id, const std::string& secret);

    /** @brief Raw Ed25519 signature over @p data. */
    [[nodiscard]] Result<ByteBuffer> sign(std::span<const std::uint8_t> data) const;

    [[nodiscard]] bool verify(std::span<const std::uint8_t> data, std::span<const std::uint8_t> signature) const;

    /** @brief Constant-time check of an operator secret against its stored salted hash. */
    [[nodiscard]] bool verify_operator(std::string_view operator_id, std::string_view secret) const;

    [[nodiscard]] bool is_provisioned() const noexcept { return static_cast<bool>(private_key_); }
    [[nodiscard]] const std::string& drone_id() const noexcept { return str_drone_id_; }
    [[nodiscard]] const std::string& org_id() const noexcept { return str_org_id_; }
    [[nodiscard]] const std::string& hardware_fingerprint() const noexcept { return str_hardware_fingerprint_; }
    [[nodiscard]] const std::string& public_key_pem() const noexcept { return str_public_key_pem_; }
    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return identity_dir_; }

    /** @brief SHA-256 over `serial|mac` read beneath @p system_root. */
    [[nodiscard]] static std::string compute_hardware_fingerprint(
        const std::filesystem::path& system_root,
        IdGenerator& id_generator
    );

  private:
    struct OperatorCredential final {
        std::string salt_hex{};
        std::string hash_hex{};
    };

    DroneIdentity(std::filesystem::path identity_dir, std::shared_ptr<IdGenerator> id_generator, std::filesystem::path system_root);

    [[nodiscard]] Status load();
    [[nodiscard]] Status save_operators() const;
    [[nodiscard]] Result<OperatorCredential> make_credential(std::string_view secret) const;

    std::filesystem::path identity_dir_;
    std::filesystem::path system_root_;
    std::shared_ptr<IdGenerator> id_generator_;
    std::shared_ptr<spdlog::logger> logger_;

    PrivateKeyPtr private_key_{};
    std::string str_drone_id_{};
    std::string str_org_id_{};
    std::string str_hardware_fingerprint_{};
    std::string str_public_key_pem_{};

    mutable std::mutex operators_mutex_;
    std::map<std::string, OperatorCredential, std::less<>> map_operators_{};
};

}  // namespace drone_sentry
