// File: types/camera_intrinsics.cpp

#include "types/camera_intrinsics.hpp"

#include <cmath>

namespace types {

    CameraIntrinsics CameraIntrinsics::fromCameraMatrix(const Eigen::Matrix3d &K, const cv::Size &reference_size) {
        return {K(0, 0), K(1, 1), K(0, 2), K(1, 2), reference_size};
    }

    Eigen::Matrix3d CameraIntrinsics::cameraMatrix() const {
        Eigen::Matrix3d K = Eigen::Matrix3d::Identity();
        K(0, 0) = fx;
        K(1, 1) = fy;
        K(0, 2) = cx;
        K(1, 2) = cy;
        return K;
    }

    double CameraIntrinsics::focalLength(const MeasurementAxis axis) const noexcept {
        switch (axis) {
            case MeasurementAxis::Height:
            case MeasurementAxis::ShoulderHeight:
                return fy;
            case MeasurementAxis::Width:
                return fx;
            case MeasurementAxis::Diagonal:
                return (fx + fy) / 2.0;
        }
        return fy;
    }

    bool CameraIntrinsics::isValid() const noexcept {
        return std::isfinite(fx) && std::isfinite(fy) && fx > 0.0 && fy > 0.0;
    }

} // namespace types
