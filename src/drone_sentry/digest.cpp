#include "drone_sentry/digest.hpp"

#include <array>
#include <fstream>
#include <memory>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace drone_sentry {

namespace {

constexpr std::size_t k_file_chunk_bytes{8192};

struct DigestContextDeleter final {
    void operator()(EVP_MD_CTX* context) const noexcept { EVP_MD_CTX_free(context); }
};
using DigestContextPtr = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string digest_to_hex(const unsigned char* digest, unsigned int length) {
    return hex_encode(std::span<const std::uint8_t>(digest, length));
}

std::string sha256_raw(const void* data, std::size_t size) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_length = 0;
    if (EVP_Digest(data, size, digest.data(), &digest_length, EVP_sha256(), nullptr) != 1) {
        return {};
    }
    return digest_to_hex(digest.data(), digest_length);
}

}  // namespace

std::string sha256_hex(std::string_view data) {
    return sha256_raw(data.data(), data.size());
}

std::string sha256_hex(std::span<const std::byte> data) {
    return sha256_raw(data.data(), data.size());
}

Result<std::string> sha256_hex_file(const std::filesystem::path& file_path) {
    std::ifstream stream(file_path, std::ios::binary);
    if (!stream) {
        return make_error(ErrorKind::IoFailure, "Unable to open " + file_path.string());
    }

    DigestContextPtr context{EVP_MD_CTX_new()};
    if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        return make_error(ErrorKind::CryptoFailure, "SHA-256 context initialisation failed");
    }

    std::array<char, k_file_chunk_bytes> chunk{};
    while (stream) {
        stream.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const std::streamsize read_count = stream.gcount();
        if (read_count > 0 && EVP_DigestUpdate(context.get(), chunk.data(), static_cast<std::size_t>(read_count)) != 1) {
            return make_error(ErrorKind::CryptoFailure, "SHA-256 update failed");
        }
    }
    if (stream.bad()) {
        return make_error(ErrorKind::IoFailure, "Read error on " + file_path.string());
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(context.get(), digest.data(), &digest_length) != 1) {
        return make_error(ErrorKind::CryptoFailure, "SHA-256 finalisation failed");
    }
    return digest_to_hex(digest.data(), digest_length);
}

std::string hmac_sha256_hex(std::string_view key, std::string_view data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_length = 0;
    const unsigned char* result = HMAC(
        EVP_sha256(),
        key.data(),
        static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(data.data()),
        data.size(),
        digest.data(),
        &digest_length
    );
    if (result == nullptr) {
        return {};
    }
    return digest_to_hex(digest.data(), digest_length);
}

std::string hex_encode(std::span<const std::uint8_t> data) {
    static constexpr char k_hex_digits[] = "0123456789abcdef";
    std::string encoded;
    encoded.reserve(data.size() * 2);
    for (const std::uint8_t value : data) {
        encoded.push_back(k_hex_digits[value >> 4]);
        encoded.push_back(k_hex_digits[value & 0x0F]);
    }
    return encoded;
}

std::string base64_encode(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return {};
    }
    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()),
        data.data(),
        static_cast<int>(data.size())
    );
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

std::optional<ByteBuffer> base64_decode(std::string_view encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) {
        return std::nullopt;
    }
    ByteBuffer decoded(3 * encoded.size() / 4);
    const int written = EVP_DecodeBlock(
        decoded.data(),
        reinterpret_cast<const unsigned char*>(encoded.data()),
        static_cast<int>(encoded.size())
    );
    if (written < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t padding = 0;
    if (encoded.back() == '=') {
        ++padding;
        if (encoded[encoded.size() - 2] == '=') {
            ++padding;
        }
    }
    decoded.resize(static_cast<std::size_t>(written) - padding);
    return decoded;
}

bool constant_time_equals(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    if (lhs.empty()) {
        return true;
    }
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

Result<ByteBuffer> secure_random_bytes(std::size_t count) {
    ByteBuffer buffer(count);
    if (count > 0 && RAND_bytes(buffer.data(), static_cast<int>(count)) != 1) {
        return make_error(ErrorKind::CryptoFailure, "RAND_bytes failed");
    }
    return buffer;
}

}  // namespace drone_sentry
