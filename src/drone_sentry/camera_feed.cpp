#include "drone_sentry/camera_feed.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

#include "drone_sentry/logging.hpp"

namespace drone_sentry {

namespace {
constexpr std::size_t k_bytes_per_pixel{3};
}  // namespace

SyntheticCameraFeed::SyntheticCameraFeed(SyntheticCameraOptions options)
    : options_(options),
      logger_(get_logger()) {
    if (options_.width_px <= 0 || options_.height_px <= 0 || options_.frames_per_second <= 0.0) {
        throw std::invalid_argument("SyntheticCameraFeed requires positive dimensions and frame rate");
    }
}

SyntheticCameraFeed::~SyntheticCameraFeed() {
    stop();
}

Status SyntheticCameraFeed::open() {
    if (options_.fail_open) {
        logger_->error("Failed to open camera source: synthetic");
        return make_error(ErrorKind::IoFailure, "Camera failed to open");
    }
    flag_open_ = true;
    logger_->info("Camera opened: synthetic ({}x{} @ {:.0f}fps)",
                  options_.width_px,
                  options_.height_px,
                  options_.frames_per_second);
    return Status::success();
}

bool SyntheticCameraFeed::is_open() const {
    return flag_open_;
}

Status SyntheticCameraFeed::start() {
    if (flag_running_) {
        return Status::success();
    }
    if (!flag_open_) {
        if (Status opened = open(); !opened) {
            return opened;
        }
    }
    capture_once();
    flag_running_ = true;
    thread_capture_ = std::thread([this] { capture_loop(); });
    logger_->info("Camera capture started");
    return Status::success();
}

void SyntheticCameraFeed::stop() {
    const bool was_running = flag_running_.exchange(false);
    if (thread_capture_.joinable()) {
        thread_capture_.join();
    }
    if (was_running || flag_open_) {
        flag_open_ = false;
        logger_->info("Camera capture stopped");
    }
}

std::shared_ptr<const CameraFrame> SyntheticCameraFeed::read() const {
    return mailbox_.latest();
}

void SyntheticCameraFeed::capture_once() {
    mailbox_.publish(render(next_frame_id_++));
}

void SyntheticCameraFeed::capture_loop() {
    const Duration frame_interval{1.0 / options_.frames_per_second};
    while (flag_running_) {
        std::this_thread::sleep_for(to_steady(frame_interval));
        if (!flag_running_) {
            break;
        }
        capture_once();
    }
}

CameraFrame SyntheticCameraFeed::render(std::uint64_t frame_id) const {
    CameraFrame frame{};
    frame.captured_at = SteadyClock::now();
    frame.width_px = options_.width_px;
    frame.height_px = options_.height_px;
    frame.frame_id = frame_id;
    frame.buffer.resize(static_cast<std::size_t>(options_.width_px) * static_cast<std::size_t>(options_.height_px) * k_bytes_per_pixel);

    // Diagonal gradient shifted per frame so consecutive frames hash differently.
    std::size_t offset = 0;
    for (int row = 0; row < options_.height_px; ++row) {
        for (int column = 0; column < options_.width_px; ++column) {
            frame.buffer[offset++] = static_cast<std::byte>((column + frame_id) & 0xFF);
            frame.buffer[offset++] = static_cast<std::byte>((row + frame_id * 3) & 0xFF);
            frame.buffer[offset++] = static_cast<std::byte>((column + row) & 0xFF);
        }
    }
    return frame;
}

CameraFrame crop_frame(const CameraFrame& frame, int x1, int y1, int x2, int y2, int padding_px) {
    const int left = std::clamp(std::min(x1, x2) - padding_px, 0, frame.width_px);
    const int right = std::clamp(std::max(x1, x2) + padding_px, 0, frame.width_px);
    const int top = std::clamp(std::min(y1, y2) - padding_px, 0, frame.height_px);
    const int bottom = std::clamp(std::max(y1, y2) + padding_px, 0, frame.height_px);

    CameraFrame crop{};
    crop.captured_at = frame.captured_at;
    crop.frame_id = frame.frame_id;
    crop.width_px = right - left;
    crop.height_px = bottom - top;
    if (crop.width_px <= 0 || crop.height_px <= 0) {
        crop.width_px = 0;
        crop.height_px = 0;
        return crop;
    }

    const auto row_bytes = static_cast<std::size_t>(crop.width_px) * k_bytes_per_pixel;
    crop.buffer.reserve(row_bytes * static_cast<std::size_t>(crop.height_px));
    for (int row = top; row < bottom; ++row) {
        const auto start = (static_cast<std::size_t>(row) * static_cast<std::size_t>(frame.width_px) + static_cast<std::size_t>(left)) * k_bytes_per_pixel;
        crop.buffer.insert(crop.buffer.end(),
                           frame.buffer.begin() + static_cast<std::ptrdiff_t>(start),
                           frame.buffer.begin() + static_cast<std::ptrdiff_t>(start + row_bytes));
    }
    return crop;
}

Status write_ppm(const std::filesystem::path& file_path, const CameraFrame& frame) {
    const auto expected_bytes = static_cast<std::size_t>(std::max(frame.width_px, 0))
        * static_cast<std::size_t>(std::max(frame.height_px, 0)) * k_bytes_per_pixel;
    if (frame.buffer.size() != expected_bytes) {
        return make_error(ErrorKind::InvalidArgument, "Frame buffer does not match its dimensions");
    }

    std::error_code error;
    if (file_path.has_parent_path()) {
        std::filesystem::create_directories(file_path.parent_path(), error);
    }

    std::ofstream stream(file_path, std::ios::binary | std::ios::trunc);
    if (!stream) {
        return make_error(ErrorKind::IoFailure, fmt::format("Cannot open {} for writing", file_path.string()));
    }
    stream << "P6\n" << frame.width_px << ' ' << frame.height_px << "\n255\n";
    stream.write(reinterpret_cast<const char*>(frame.buffer.data()), static_cast<std::streamsize>(frame.buffer.size()));
    if (!stream) {
        return make_error(ErrorKind::IoFailure, fmt::format("Failed writing {}", file_path.string()));
    }
    return Status::success();
}

}  // namespace drone_sentry
