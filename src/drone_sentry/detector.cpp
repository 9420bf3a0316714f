#include "drone_sentry/detector.hpp"

#include <algorithm>
#include <utility>

namespace drone_sentry {

SyntheticDetector::SyntheticDetector(SyntheticDetectorOptions options) : options_(std::move(options)) {}

std::string SyntheticDetector::backend_name() const {
    return options_.ready ? "synthetic" : "none";
}

std::vector<Detection> SyntheticDetector::detect(const CameraFrame& frame) {
    if (!options_.ready || frame.empty()) {
        return {};
    }
    {
        std::scoped_lock lock(mutex_);
        if (!queue_scripted_.empty()) {
            std::vector<Detection> batch = std::move(queue_scripted_.front());
            queue_scripted_.pop_front();
            return batch;
        }
    }
    if (options_.every_n_frames == 0 || frame.frame_id % options_.every_n_frames != 0) {
        return {};
    }

    const int half = options_.box_size_px / 2;
    const int center_x = frame.width_px / 2;
    const int center_y = frame.height_px / 2;
    Detection detection{};
    detection.class_name = options_.class_name;
    detection.class_id = options_.class_id;
    detection.confidence = options_.confidence;
    detection.x1 = std::max(0, center_x - half);
    detection.y1 = std::max(0, center_y - half);
    detection.x2 = std::min(frame.width_px, center_x + half);
    detection.y2 = std::min(frame.height_px, center_y + half);
    return {detection};
}

void SyntheticDetector::script(std::vector<Detection> detections) {
    std::scoped_lock lock(mutex_);
    queue_scripted_.push_back(std::move(detections));
}

}  // namespace drone_sentry
