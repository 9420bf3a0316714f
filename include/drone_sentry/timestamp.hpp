#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "drone_sentry/types.hpp"

namespace drone_sentry {

/** @brief Format as ISO-8601 UTC with microseconds, e.g. 2026-10-19T12:00:00.123456+00:00. */
[[nodiscard]] std::string format_iso8601(WallClock::time_point time_point);

/** @brief Current wall-clock time formatted with format_iso8601(). */
[[nodiscard]] std::string now_iso8601();

/**
 * @brief Parse an ISO-8601 timestamp.
 *
 * Accepts optional fractional seconds and a `Z`, `+HH:MM` or `-HH:MM` suffix
 * (no suffix is treated as UTC). Returns std::nullopt on malformed input.
 */
[[nodiscard]] std::optional<WallClock::time_point> parse_iso8601(std::string_view text);

/** @brief Compact filename-safe stamp, e.g. 20261019_120000_123456. */
[[nodiscard]] std::string format_file_stamp(WallClock::time_point time_point);

}  // namespace drone_sentry
