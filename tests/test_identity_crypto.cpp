#include <catch2/catch.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "drone_sentry/crypto_engine.hpp"
#include "drone_sentry/digest.hpp"
#include "drone_sentry/drone_identity.hpp"
#include "drone_sentry/timestamp.hpp"
#include "logging_test_fixture.hpp"
#include "test_workspace.hpp"

using namespace drone_sentry;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_sentry::test::ensure_logger_initialized();
    return true;
}();

std::string read_text(const std::filesystem::path& file_path) {
    std::ifstream stream(file_path);
    return std::string{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
}

nlohmann::json command_payload(const std::string& command, WallClock::time_point issued_at) {
    return nlohmann::json{{"command", command}, {"timestamp", format_iso8601(issued_at)}};
}
}  // namespace

TEST_CASE("SHA-256 and HMAC match published vectors") {
    REQUIRE(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(
        hmac_sha256_hex("key", "The quick brown fox jumps over the lazy dog")
        == "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8"
    );
    REQUIRE(constant_time_equals("abc", "abc"));
    REQUIRE_FALSE(constant_time_equals("abc", "abd"));
    REQUIRE_FALSE(constant_time_equals("abc", "abcd"));
}

TEST_CASE("Base64 decoding rejects malformed input") {
    const std::vector<std::uint8_t> bytes{0x00, 0xff, 0x10, 0x20};
    const std::string encoded = base64_encode(bytes);
    const auto decoded = base64_decode(encoded);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == bytes);
    REQUIRE_FALSE(base64_decode("***not base64***").has_value());
}

TEST_CASE("Provisioning persists an identity that reloads unchanged") {
    drone_sentry::test::ProvisionedDrone drone{};
    const auto identity_dir = drone.workspace.path() / "identity";

    REQUIRE(drone.identity->is_provisioned());
    REQUIRE(drone.provisioned.org_id == "test-org");
    REQUIRE(drone.provisioned.operator_secret.size() == 64);
    REQUIRE(std::filesystem::exists(identity_dir / "drone_key.pem"));
    REQUIRE(
        (std::filesystem::status(identity_dir / "drone_key.pem").permissions() & std::filesystem::perms::group_read)
        == std::filesystem::perms::none
    );
    REQUIRE(read_text(identity_dir / "operators.json").find(drone.provisioned.operator_secret) == std::string::npos);

    auto reopened = DroneIdentity::open(identity_dir, drone.id_generator, drone.workspace.path() / "system");
    REQUIRE(reopened.ok());
    REQUIRE(reopened.value()->drone_id() == drone.provisioned.drone_id);
    REQUIRE(reopened.value()->public_key_pem() == drone.provisioned.public_key_pem);
    REQUIRE(reopened.value()->verify_operator(drone.provisioned.operator_id, drone.provisioned.operator_secret));
}

TEST_CASE("Provisioning twice fails and keeps the original key") {
    drone_sentry::test::ProvisionedDrone drone{};
    const auto key_path = drone.workspace.path() / "identity" / "drone_key.pem";
    const std::string original_key = read_text(key_path);

    const auto again = drone.identity->provision("other-org");
    REQUIRE_FALSE(again.ok());
    REQUIRE(again.kind() == ErrorKind::AlreadyProvisioned);
    REQUIRE(read_text(key_path) == original_key);
    REQUIRE(drone.identity->org_id() == "test-org");
}

TEST_CASE("Hardware fingerprint is stable for one system root") {
    drone_sentry::test::ProvisionedDrone drone{};
    IdGenerator id_generator{};
    const auto root = drone.workspace.path() / "system";

    const std::string first = DroneIdentity::compute_hardware_fingerprint(root, id_generator);
    REQUIRE(first == DroneIdentity::compute_hardware_fingerprint(root, id_generator));
    REQUIRE(first == drone.identity->hardware_fingerprint());
    REQUIRE(first == sha256_hex("0123456789abcdef0123456789abcdef|02:00:00:aa:bb:cc"));
}

TEST_CASE("Unprovisioned identities cannot sign or add operators") {
    drone_sentry::test::TemporaryDirectory directory{};
    auto identity = DroneIdentity::open(directory.path() / "identity", std::make_shared<IdGenerator>());
    REQUIRE(identity.ok());
    REQUIRE_FALSE(identity.value()->is_provisioned());

    const std::vector<std::uint8_t> data{1, 2, 3};
    REQUIRE(identity.value()->sign(data).kind() == ErrorKind::NotProvisioned);
    REQUIRE(identity.value()->add_operator("op", "secret").kind() == ErrorKind::NotProvisioned);
}

TEST_CASE("Additional operators verify only with their own secret") {
    drone_sentry::test::ProvisionedDrone drone{};
    REQUIRE(drone.identity->add_operator("ops-lead", "correct horse").ok());

    REQUIRE(drone.identity->verify_operator("ops-lead", "correct horse"));
    REQUIRE_FALSE(drone.identity->verify_operator("ops-lead", "battery staple"));
    REQUIRE_FALSE(drone.identity->verify_operator("nobody", "correct horse"));
    REQUIRE(drone.identity->add_operator("", "x").kind() == ErrorKind::InvalidArgument);
}

TEST_CASE("Signatures verify and fail after any change") {
    drone_sentry::test::ProvisionedDrone drone{};
    const auto signature = drone.crypto->sign_data("mission-1|payload");
    REQUIRE(signature.ok());

    REQUIRE(drone.crypto->verify_signature("mission-1|payload", signature.value()));
    REQUIRE_FALSE(drone.crypto->verify_signature("mission-1|payloaD", signature.value()));
    REQUIRE_FALSE(drone.crypto->verify_signature("mission-1|payload", "not-base64!"));
}

TEST_CASE("Operator commands are verified in order") {
    drone_sentry::test::ProvisionedDrone drone{};
    const std::string& operator_id = drone.provisioned.operator_id;
    const std::string& secret = drone.provisioned.operator_secret;
    const Duration max_age{30.0};
    const auto now = WallClock::now();

    SECTION("fresh command with a valid MAC is accepted") {
        const auto payload = command_payload("pause", now);
        const auto verdict = drone.crypto->verify_command(
            payload, operator_id, secret, CryptoEngine::compute_command_mac(payload, secret), max_age, now
        );
        REQUIRE(verdict.accepted);
        REQUIRE(verdict.reason == "ok");
    }

    SECTION("wrong secret is rejected before the MAC is considered") {
        const auto payload = command_payload("pause", now);
        const auto verdict = drone.crypto->verify_command(
            payload, operator_id, "wrong", CryptoEngine::compute_command_mac(payload, "wrong"), max_age, now
        );
        REQUIRE_FALSE(verdict.accepted);
        REQUIRE(verdict.reason == "invalid_operator");
        REQUIRE(verdict.error_kind == ErrorKind::InvalidOperator);
    }

    SECTION("missing or unparseable timestamp is invalid") {
        nlohmann::json payload{{"command", "pause"}};
        auto verdict = drone.crypto->verify_command(
            payload, operator_id, secret, CryptoEngine::compute_command_mac(payload, secret), max_age, now
        );
        REQUIRE(verdict.reason == "invalid_timestamp");

        payload["timestamp"] = "noon";
        verdict = drone.crypto->verify_command(
            payload, operator_id, secret, CryptoEngine::compute_command_mac(payload, secret), max_age, now
        );
        REQUIRE(verdict.reason == "invalid_timestamp");
    }

    SECTION("stale and future-dated commands expire") {
        const auto stale = command_payload("abort", now - std::chrono::seconds{31});
        auto verdict = drone.crypto->verify_command(
            stale, operator_id, secret, CryptoEngine::compute_command_mac(stale, secret), max_age, now
        );
        REQUIRE(verdict.reason == "command_expired");

        const auto future = command_payload("abort", now + std::chrono::seconds{45});
        verdict = drone.crypto->verify_command(
            future, operator_id, secret, CryptoEngine::compute_command_mac(future, secret), max_age, now
        );
        REQUIRE(verdict.reason == "command_expired");
    }

    SECTION("MAC over a different payload is rejected") {
        const auto payload = command_payload("abort", now);
        const auto signed_for = command_payload("resume", now);
        const auto verdict = drone.crypto->verify_command(
            payload, operator_id, secret, CryptoEngine::compute_command_mac(signed_for, secret), max_age, now
        );
        REQUIRE(verdict.reason == "invalid_hmac");
        REQUIRE(verdict.error_kind == ErrorKind::InvalidSignature);
    }
}

TEST_CASE("AES-256-GCM seals and detects tampering") {
    const std::string message = "evidence frame";
    const std::vector<std::uint8_t> plaintext(message.begin(), message.end());

    const auto sealed = CryptoEngine::encrypt(plaintext);
    REQUIRE(sealed.ok());
    REQUIRE(sealed.value().blob.size() == CryptoEngine::k_nonce_bytes + plaintext.size() + CryptoEngine::k_tag_bytes);

    const auto opened = CryptoEngine::decrypt(sealed.value().blob, sealed.value().key);
    REQUIRE(opened.ok());
    REQUIRE(opened.value() == plaintext);

    ByteBuffer tampered = sealed.value().blob;
    tampered[CryptoEngine::k_nonce_bytes] ^= 0x01;
    REQUIRE(CryptoEngine::decrypt(tampered, sealed.value().key).kind() == ErrorKind::CryptoFailure);

    REQUIRE(CryptoEngine::encrypt(plaintext, ByteBuffer(16, 0)).kind() == ErrorKind::InvalidArgument);
}

TEST_CASE("File hashes match in-memory hashes") {
    drone_sentry::test::TemporaryDirectory directory{};
    const auto file_path = directory.write("frame.bin", "abc");

    const auto hashed = CryptoEngine::hash_file(file_path);
    REQUIRE(hashed.ok());
    REQUIRE(hashed.value() == sha256_hex("abc"));
    REQUIRE(CryptoEngine::hash_file(directory.path() / "missing.bin").kind() == ErrorKind::IoFailure);
}
