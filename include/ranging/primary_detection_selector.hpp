// File: ranging/primary_detection_selector.hpp

#ifndef PRIMARY_DETECTION_SELECTOR_HPP
#define PRIMARY_DETECTION_SELECTOR_HPP

#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "types/detection.hpp"

namespace ranging {

    /*
     * Picks the detection the user is most likely aiming at:
     *   score = confidence / (|normalized center - aim point| + 0.1)
     * The aim point is the image center. When scores tie, the detection that comes first in
     * the input wins. Invalid detections (non-finite confidence, empty box) are never selected.
     */
    class PrimaryDetectionSelector {
    public:
        static constexpr double kCenterBias = 0.1;

        [[nodiscard]] static double score(const types::Detection &detection, const cv::Size &frame_size) noexcept;

        [[nodiscard]] std::optional<std::size_t> selectIndex(const std::vector<types::Detection> &detections,
                                                             const cv::Size &frame_size) const;

        [[nodiscard]] std::optional<types::Detection> select(const std::vector<types::Detection> &detections,
                                                             const cv::Size &frame_size) const;
    };

} // namespace ranging

#endif // PRIMARY_DETECTION_SELECTOR_HPP
