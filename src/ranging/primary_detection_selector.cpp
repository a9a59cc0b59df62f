// File: ranging/primary_detection_selector.cpp

#include "ranging/primary_detection_selector.hpp"

#include <cmath>

#include "common/formatting/fmt_ranging.hpp"
#include "common/logging/logger.hpp"

namespace ranging {

    double PrimaryDetectionSelector::score(const types::Detection &detection, const cv::Size &frame_size) noexcept {
        const cv::Point2d center = detection.normalizedCenter(frame_size);
        const double offset = std::hypot(center.x - 0.5, center.y - 0.5);
        return detection.confidence / (offset + kCenterBias);
    }

    std::optional<std::size_t> PrimaryDetectionSelector::selectIndex(const std::vector<types::Detection> &detections,
                                                                     const cv::Size &frame_size) const {
        std::optional<std::size_t> best_index;
        double best_score = 0.0;

        for (std::size_t i = 0; i < detections.size(); ++i) {
            if (!detections[i].isValid()) {
                LOG_DEBUG("Ignoring invalid {}", detections[i]);
                continue;
            }
            // Strict comparison keeps the earliest detection on ties.
            const double current = score(detections[i], frame_size);
            if (!best_index || current > best_score) {
                best_index = i;
                best_score = current;
            }
        }

        if (best_index) {
            LOG_TRACE("Primary detection: {} (score {:.3f})", detections[*best_index], best_score);
        }
        return best_index;
    }

    std::optional<types::Detection> PrimaryDetectionSelector::select(const std::vector<types::Detection> &detections,
                                                                     const cv::Size &frame_size) const {
        const auto index = selectIndex(detections, frame_size);
        if (!index) {
            return std::nullopt;
        }
        return detections[*index];
    }

} // namespace ranging
