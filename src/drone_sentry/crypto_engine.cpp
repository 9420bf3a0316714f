#include "drone_sentry/crypto_engine.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <openssl/evp.h>

#include "drone_sentry/drone_identity.hpp"
#include "drone_sentry/logging.hpp"
#include "drone_sentry/models.hpp"
#include "drone_sentry/timestamp.hpp"

namespace drone_sentry {

namespace {

struct CipherContextDeleter final {
    void operator()(EVP_CIPHER_CTX* context) const noexcept { EVP_CIPHER_CTX_free(context); }
};
using CipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

std::span<const std::uint8_t> as_bytes(std::string_view text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

CommandVerdict reject(std::string reason, ErrorKind kind) {
    return CommandVerdict{false, std::move(reason), kind};
}

}  // namespace

CryptoEngine::CryptoEngine(std::shared_ptr<const DroneIdentity> identity)
    : identity_(std::move(identity)),
      logger_(get_logger()) {
    if (!identity_) {
        throw std::invalid_argument("CryptoEngine requires a drone identity");
    }
}

Result<std::string> CryptoEngine::sign_data(std::string_view data) const {
    auto signature = identity_->sign(as_bytes(data));
    if (!signature) {
        return signature.error();
    }
    return base64_encode(signature.value());
}

bool CryptoEngine::verify_signature(std::string_view data, std::string_view signature_b64) const {
    const auto signature = base64_decode(signature_b64);
    if (!signature) {
        return false;
    }
    return identity_->verify(as_bytes(data), *signature);
}

CommandVerdict CryptoEngine::verify_command(
    const nlohmann::json& payload,
    std::string_view operator_id,
    std::string_view secret,
    std::string_view provided_mac,
    Duration max_age,
    WallClock::time_point now
) const {
    if (!identity_->verify_operator(operator_id, secret)) {
        logger_->warn("Command rejected: invalid operator {}", operator_id);
        return reject("invalid_operator", ErrorKind::InvalidOperator);
    }

    const auto timestamp_it = payload.is_object() ? payload.find("timestamp") : payload.end();
    if (timestamp_it == payload.end() || !timestamp_it->is_string()) {
        logger_->warn("Command rejected: missing timestamp from operator {}", operator_id);
        return reject("invalid_timestamp", ErrorKind::InvalidTimestamp);
    }
    const auto issued_at = parse_iso8601(timestamp_it->get<std::string>());
    if (!issued_at) {
        logger_->warn("Command rejected: unparseable timestamp from operator {}", operator_id);
        return reject("invalid_timestamp", ErrorKind::InvalidTimestamp);
    }
    const double age_s = std::abs(std::chrono::duration_cast<Duration>(now - *issued_at).count());
    if (age_s > max_age.count()) {
        logger_->warn("Command rejected: expired (age={:.1f}s) from operator {}", age_s, operator_id);
        return reject("command_expired", ErrorKind::CommandExpired);
    }

    const std::string expected_mac = compute_command_mac(payload, secret);
    if (!constant_time_equals(expected_mac, provided_mac)) {
        logger_->warn("Command rejected: MAC mismatch from operator {}", operator_id);
        return reject("invalid_hmac", ErrorKind::InvalidSignature);
    }

    return CommandVerdict{true, "ok", std::nullopt};
}

std::string CryptoEngine::compute_command_mac(const nlohmann::json& payload, std::string_view secret) {
    return hmac_sha256_hex(secret, canonical_json(payload));
}

Result<SealedBlob> CryptoEngine::encrypt(std::span<const std::uint8_t> plaintext, std::optional<ByteBuffer> key) {
    if (!key) {
        auto generated = secure_random_bytes(k_key_bytes);
        if (!generated) {
            return generated.error();
        }
        key = std::move(generated).value();
    }
    if (key->size() != k_key_bytes) {
        return make_error(ErrorKind::InvalidArgument, "AES-256-GCM requires a 32-byte key");
    }

    auto nonce = secure_random_bytes(k_nonce_bytes);
    if (!nonce) {
        return nonce.error();
    }

    SealedBlob sealed{};
    sealed.blob.resize(k_nonce_bytes + plaintext.size() + k_tag_bytes);
    std::copy(nonce.value().begin(), nonce.value().end(), sealed.blob.begin());

    CipherContextPtr context{EVP_CIPHER_CTX_new()};
    int written = 0;
    int finished = 0;
    std::uint8_t* cipher_out = sealed.blob.data() + k_nonce_bytes;
    if (!context || EVP_EncryptInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(k_nonce_bytes), nullptr) != 1
        || EVP_EncryptInit_ex(context.get(), nullptr, nullptr, key->data(), nonce.value().data()) != 1
        || EVP_EncryptUpdate(context.get(), cipher_out, &written, plaintext.data(), static_cast<int>(plaintext.size())) != 1
        || EVP_EncryptFinal_ex(context.get(), cipher_out + written, &finished) != 1
        || EVP_CIPHER_CTX_ctrl(
               context.get(),
               EVP_CTRL_GCM_GET_TAG,
               static_cast<int>(k_tag_bytes),
               cipher_out + written + finished
           ) != 1) {
        return make_error(ErrorKind::CryptoFailure, "AES-256-GCM encryption failed");
    }
    sealed.key = std::move(*key);
    return sealed;
}

Result<ByteBuffer> CryptoEngine::decrypt(std::span<const std::uint8_t> blob, std::span<const std::uint8_t> key) {
    if (key.size() != k_key_bytes) {
        return make_error(ErrorKind::InvalidArgument, "AES-256-GCM requires a 32-byte key");
    }
    if (blob.size() < k_nonce_bytes + k_tag_bytes) {
        return make_error(ErrorKind::InvalidArgument, "Sealed blob is shorter than nonce and tag");
    }

    const std::span<const std::uint8_t> nonce = blob.first(k_nonce_bytes);
    const std::span<const std::uint8_t> ciphertext = blob.subspan(k_nonce_bytes, blob.size() - k_nonce_bytes - k_tag_bytes);
    ByteBuffer tag(blob.end() - static_cast<std::ptrdiff_t>(k_tag_bytes), blob.end());

    ByteBuffer plaintext(ciphertext.size());
    CipherContextPtr context{EVP_CIPHER_CTX_new()};
    int written = 0;
    int finished = 0;
    if (!context || EVP_DecryptInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(k_nonce_bytes), nullptr) != 1
        || EVP_DecryptInit_ex(context.get(), nullptr, nullptr, key.data(), nonce.data()) != 1
        || EVP_DecryptUpdate(context.get(), plaintext.data(), &written, ciphertext.data(), static_cast<int>(ciphertext.size())) != 1
        || EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(k_tag_bytes), tag.data()) != 1) {
        return make_error(ErrorKind::CryptoFailure, "AES-256-GCM decryption setup failed");
    }
    if (EVP_DecryptFinal_ex(context.get(), plaintext.data() + written, &finished) != 1) {
        return make_error(ErrorKind::CryptoFailure, "AES-256-GCM authentication failed");
    }
    plaintext.resize(static_cast<std::size_t>(written + finished));
    return plaintext;
}

std::string CryptoEngine::hash_bytes(std::span<const std::byte> data) {
    return sha256_hex(data);
}

Result<std::string> CryptoEngine::hash_file(const std::filesystem::path& file_path) {
    return sha256_hex_file(file_path);
}

}  // namespace drone_sentry
