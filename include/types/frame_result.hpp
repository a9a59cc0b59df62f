// File: types/frame_result.hpp

#ifndef FRAME_RESULT_HPP
#define FRAME_RESULT_HPP

#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "types/camera_intrinsics.hpp"
#include "types/detection.hpp"

namespace types {

    /*
     * Everything the detector and depth collaborators produced for one camera frame.
     * depth_map holds single-channel inverse depth (larger = closer) and may have a
     * different resolution than the frame; samplers rescale coordinates per axis.
     */
    struct FrameResult {
        std::vector<Detection> detections;
        std::optional<cv::Mat> depth_map;
        CameraIntrinsics intrinsics;
        cv::Size frame_size;
        Timestamp timestamp{};

        [[nodiscard]] bool hasDepth() const noexcept { return depth_map.has_value() && !depth_map->empty(); }
    };

} // namespace types

#endif // FRAME_RESULT_HPP
