// === Camera Feed =============================================================
//
// Frame acquisition boundary. `FrameSource` is the capability the mission
// controller consumes; `SyntheticCameraFeed` is the built-in simulation source
// whose capture thread publishes immutable frames through a single-slot
// mailbox. Crop and PPM helpers produce the evidence files attached to
// findings.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/logger.h>

#include "drone_sentry/errors.hpp"
#include "drone_sentry/types.hpp"

namespace drone_sentry {

/** @brief Captured RGB8 frame plus metadata. */
struct CameraFrame final {
    TimePoint captured_at{SteadyClock::now()};
    std::vector<std::byte> buffer{};   /**< Row-major RGB, 3 bytes per pixel. */
    int width_px{};
    int height_px{};
    std::uint64_t frame_id{};

    [[nodiscard]] bool empty() const noexcept { return width_px <= 0 || height_px <= 0 || buffer.empty(); }
};

/**
 * @brief Single-slot mailbox holding the most recent published value.
 *
 * Writers replace the slot; readers share the immutable snapshot.
 */
template <typename T>
class LatestValueMailbox final {
  public:
    void publish(T value) {
        auto snapshot = std::make_shared<const T>(std::move(value));
        std::scoped_lock lock(mutex_);
        latest_ = std::move(snapshot);
    }

    [[nodiscard]] std::shared_ptr<const T> latest() const {
        std::scoped_lock lock(mutex_);
        return latest_;
    }

    void clear() {
        std::scoped_lock lock(mutex_);
        latest_.reset();
    }

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<const T> latest_;
};

/** @brief Capture device capability consumed by the mission controller. */
class FrameSource {
  public:
    virtual ~FrameSource() = default;

    [[nodiscard]] virtual Status open() = 0;
    [[nodiscard]] virtual bool is_open() const = 0;
    /** @brief Begin background capture, opening the device first if needed. */
    [[nodiscard]] virtual Status start() = 0;
    virtual void stop() = 0;
    /** @brief Latest complete frame, or null before the first capture. */
    [[nodiscard]] virtual std::shared_ptr<const CameraFrame> read() const = 0;
};

struct SyntheticCameraOptions final {
    int width_px{640};
    int height_px{480};
    double frames_per_second{10.0};
    bool fail_open{false};   /**< Simulate a device that cannot be opened. */
};

/** @brief Procedural frame generator with its own capture thread. */
class SyntheticCameraFeed final : public FrameSource {
  public:
    explicit SyntheticCameraFeed(SyntheticCameraOptions options = {});
    ~SyntheticCameraFeed() override;

    SyntheticCameraFeed(const SyntheticCameraFeed&) = delete;
    SyntheticCameraFeed& operator=(const SyntheticCameraFeed&) = delete;

    [[nodiscard]] Status open() override;
    [[nodiscard]] bool is_open() const override;
    [[nodiscard]] Status start() override;
    void stop() override;
    [[nodiscard]] std::shared_ptr<const CameraFrame> read() const override;

    /** @brief Generate and publish one frame on the caller's thread. */
    void capture_once();

  private:
    void capture_loop();
    [[nodiscard]] CameraFrame render(std::uint64_t frame_id) const;

    SyntheticCameraOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    LatestValueMailbox<CameraFrame> mailbox_;
    std::atomic<std::uint64_t> next_frame_id_{1};
    std::atomic<bool> flag_open_{false};
    std::atomic<bool> flag_running_{false};
    std::thread thread_capture_;
};

/**
 * @brief Copy the region [x1,x2) x [y1,y2) grown by @p padding_px, clamped to the frame.
 *
 * A box entirely outside the frame yields an empty frame.
 */
[[nodiscard]] CameraFrame crop_frame(const CameraFrame& frame, int x1, int y1, int x2, int y2, int padding_px);

/** @brief Write @p frame as a binary PPM (P6) image. */
[[nodiscard]] Status write_ppm(const std::filesystem::path& file_path, const CameraFrame& frame);

}  // namespace drone_sentry
