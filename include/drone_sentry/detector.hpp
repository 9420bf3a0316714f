// === Object Detector =========================================================
//
// Capability interface over the detection backend. The inference model is an
// external collaborator; which backend is active is decided when the detector
// is constructed and is invisible to the mission controller.

#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "drone_sentry/camera_feed.hpp"

namespace drone_sentry {

/** @brief One detected object with its pixel bounding box. */
struct Detection final {
    std::string class_name{};
    int class_id{};
    double confidence{};
    int x1{};   /**< Top-left x. */
    int y1{};   /**< Top-left y. */
    int x2{};   /**< Bottom-right x. */
    int y2{};   /**< Bottom-right y. */

    [[nodiscard]] int area() const noexcept { return (x2 - x1) * (y2 - y1); }
};

class ObjectDetector {
  public:
    virtual ~ObjectDetector() = default;

    /** @brief False until a model is loaded. */
    [[nodiscard]] virtual bool is_ready() const = 0;
    [[nodiscard]] virtual std::string backend_name() const = 0;
    [[nodiscard]] virtual std::vector<Detection> detect(const CameraFrame& frame) = 0;
};

struct SyntheticDetectorOptions final {
    std::string class_name{"person"};
    int class_id{0};
    double confidence{0.87};
    std::uint64_t every_n_frames{0};   /**< 0 disables periodic detections. */
    int box_size_px{80};
    bool ready{true};
};

/**
 * @brief Simulation backend.
 *
 * Reports the configured class on every Nth frame and replays scripted
 * detection batches first, one batch per detect() call.
 */
class SyntheticDetector final : public ObjectDetector {
  public:
    explicit SyntheticDetector(SyntheticDetectorOptions options = {});

    [[nodiscard]] bool is_ready() const override { return options_.ready; }
    [[nodiscard]] std::string backend_name() const override;
    [[nodiscard]] std::vector<Detection> detect(const CameraFrame& frame) override;

    /** @brief Queue a batch returned by a later detect() call. */
    void script(std::vector<Detection> detections);

  private:
    SyntheticDetectorOptions options_;
    std::mutex mutex_;
    std::deque<std::vector<Detection>> queue_scripted_;
};

}  // namespace drone_sentry
