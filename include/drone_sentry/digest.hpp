// === Digest Helpers ==========================================================
//
// Thin OpenSSL-backed primitives shared by the data models and the crypto
// engine: SHA-256 content hashing, base64/hex transport encodings and a
// constant-time comparison.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "drone_sentry/errors.hpp"

namespace drone_sentry {

using ByteBuffer = std::vector<std::uint8_t>;

/** @brief Lower-case hex SHA-256 of @p data. */
[[nodiscard]] std::string sha256_hex(std::string_view data);

/** @brief Lower-case hex SHA-256 of a raw byte span. */
[[nodiscard]] std::string sha256_hex(std::span<const std::byte> data);

/** @brief Lower-case hex SHA-256 of a file, streamed in 8 KiB chunks. */
[[nodiscard]] Result<std::string> sha256_hex_file(const std::filesystem::path& file_path);

/** @brief Lower-case hex HMAC-SHA-256 of @p data keyed with @p key. */
[[nodiscard]] std::string hmac_sha256_hex(std::string_view key, std::string_view data);

[[nodiscard]] std::string hex_encode(std::span<const std::uint8_t> data);

[[nodiscard]] std::string base64_encode(std::span<const std::uint8_t> data);

/** @brief Decode standard base64; std::nullopt on malformed input. */
[[nodiscard]] std::optional<ByteBuffer> base64_decode(std::string_view encoded);

/** @brief Compare two strings without early exit on the first differing byte. */
[[nodiscard]] bool constant_time_equals(std::string_view lhs, std::string_view rhs) noexcept;

/** @brief Fill a buffer with cryptographically secure random bytes. */
[[nodiscard]] Result<ByteBuffer> secure_random_bytes(std::size_t count);

}  // namespace drone_sentry
