#pragma once

#include "drone_sentry/logging.hpp"

#include <filesystem>
#include <memory>

namespace drone_sentry::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "drone_sentry_tests_logs";
        return drone_sentry::initialize_logger(log_dir.string());
    }();
    (void)logger_handle;
}

}  // namespace drone_sentry::test
