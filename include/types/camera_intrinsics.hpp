// File: types/camera_intrinsics.hpp

#ifndef CAMERA_INTRINSICS_HPP
#define CAMERA_INTRINSICS_HPP

#include <Eigen/Core>
#include <opencv2/core.hpp>

#include "types/object_category.hpp"

namespace types {

    // Pinhole intrinsics in pixel units.
    struct CameraIntrinsics {
        double fx{};
        double fy{};
        double cx{};
        double cy{};
        cv::Size reference_size;

        [[nodiscard]] static CameraIntrinsics fromCameraMatrix(const Eigen::Matrix3d &K, const cv::Size &reference_size);

        [[nodiscard]] Eigen::Matrix3d cameraMatrix() const;

        // Focal length along the image axis the measurement is taken on.
        [[nodiscard]] double focalLength(MeasurementAxis axis) const noexcept;

        [[nodiscard]] bool isValid() const noexcept;
    };

} // namespace types

#endif // CAMERA_INTRINSICS_HPP
