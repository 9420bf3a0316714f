// === Crypto Engine ===========================================================
//
// Cryptographic operations bound to one drone identity: base64 Ed25519
// signatures for findings and audit entries, operator command verification
// (credential, freshness, MAC), AES-256-GCM sealing and SHA-256 content
// hashing for evidence.

#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include "drone_sentry/digest.hpp"
#include "drone_sentry/errors.hpp"
#include "drone_sentry/types.hpp"

namespace drone_sentry {

class DroneIdentity;

/** @brief Outcome of verify_command(); `reason` is "ok" on acceptance. */
struct CommandVerdict final {
    bool accepted{false};
    std::string reason{};
    std::optional<ErrorKind> error_kind{};
};

/** @brief AES-256-GCM output: `nonce(12) || ciphertext || tag(16)` plus the key used. */
struct SealedBlob final {
    ByteBuffer blob{};
    ByteBuffer key{};
};

class CryptoEngine final {
  public:
    static constexpr std::size_t k_key_bytes{32};
    static constexpr std::size_t k_nonce_bytes{12};
    static constexpr std::size_t k_tag_bytes{16};

    explicit CryptoEngine(std::shared_ptr<const DroneIdentity> identity);

    /** @brief Sign @p data and return the base64 signature. */
    [[nodiscard]] Result<std::string> sign_data(std::string_view data) const;

    /** @brief Verify a base64 signature. Malformed base64 yields false. */
    [[nodiscard]] bool verify_signature(std::string_view data, std::string_view signature_b64) const;

    /**
     * @brief Authenticate an operator command.
     *
     * Checks, in order, the operator credential, the freshness of the
     * payload's `timestamp` against @p now, and the hex HMAC-SHA-256 of the
     * canonical payload keyed with @p secret. Returns the first failing
     * reason: `invalid_operator`, `invalid_timestamp`, `command_expired` or
     * `invalid_hmac`.
     */
    [[nodiscard]] CommandVerdict verify_command(
        const nlohmann::json& payload,
        std::string_view operator_id,
        std::string_view secret,
        std::string_view provided_mac,
        Duration max_age,
        WallClock::time_point now = WallClock::now()
    ) const;

    /** @brief MAC a sender computes over @p payload; exposed for operator tooling. */
    [[nodiscard]] static std::string compute_command_mac(const nlohmann::json& payload, std::string_view secret);

    /** @brief Seal @p plaintext with a fresh random nonce; generates a key when none is given. */
    [[nodiscard]] static Result<SealedBlob> encrypt(
        std::span<const std::uint8_t> plaintext,
        std::optional<ByteBuffer> key = std::nullopt
    );

    /** @brief Open a blob produced by encrypt(); fails with CryptoFailure when authentication fails. */
    [[nodiscard]] static Result<ByteBuffer> decrypt(std::span<const std::uint8_t> blob, std::span<const std::uint8_t> key);

    [[nodiscard]] static std::string hash_bytes(std::span<const std::byte> data);

    [[nodiscard]] static Result<std::string> hash_file(const std::filesystem::path& file_path);

  private:
    std::shared_ptr<const DroneIdentity> identity_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_sentry
