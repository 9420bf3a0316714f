// === Version Metadata ========================================================
//
// Exposes the mission core's semantic version string used in logs and CLI output.

#pragma once

#include <string_view>

namespace drone_sentry {

inline constexpr std::string_view k_version{"0.4.0"};

}  // namespace drone_sentry
