// File: types/detection.hpp

#ifndef DETECTION_HPP
#define DETECTION_HPP

#include <chrono>
#include <cmath>
#include <string>
#include <utility>

#include <opencv2/core.hpp>

namespace types {

    using Clock = std::chrono::system_clock;
    using Timestamp = Clock::time_point;

    /*
     * One labelled bounding box reported by the object detector.
     * The box is in frame pixels with a top-left origin.
     */
    struct Detection {
        std::string label;
        double confidence{};
        cv::Rect2d box;
        Timestamp timestamp{};

        Detection() = default;

        Detection(std::string label, const double confidence, const cv::Rect2d &box, const Timestamp timestamp = {}) :
            label(std::move(label)), confidence(confidence), box(box), timestamp(timestamp) {}

        [[nodiscard]] double pixelWidth() const noexcept { return box.width; }
        [[nodiscard]] double pixelHeight() const noexcept { return box.height; }

        [[nodiscard]] cv::Point2d pixelCenter() const noexcept {
            return {box.x + box.width / 2.0, box.y + box.height / 2.0};
        }

        // Center in [0, 1] image coordinates for the given frame size.
        [[nodiscard]] cv::Point2d normalizedCenter(const cv::Size &frame_size) const noexcept {
            const cv::Point2d center = pixelCenter();
            const double width = frame_size.width > 0 ? frame_size.width : 1.0;
            const double height = frame_size.height > 0 ? frame_size.height : 1.0;
            return {center.x / width, center.y / height};
        }

        // Width over height; 0 for a degenerate box.
        [[nodiscard]] double aspectRatio() const noexcept { return box.height > 0 ? box.width / box.height : 0.0; }

        [[nodiscard]] bool isValid() const noexcept {
            return std::isfinite(confidence) && confidence >= 0.0 && confidence <= 1.0 && std::isfinite(box.x) &&
                   std::isfinite(box.y) && std::isfinite(box.width) && std::isfinite(box.height) && box.width > 0 &&
                   box.height > 0;
        }
    };

} // namespace types

#endif // DETECTION_HPP
