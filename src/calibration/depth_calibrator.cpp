// File: calibration/depth_calibrator.cpp

#include "calibration/depth_calibrator.hpp"

#include <cmath>

#include "common/logging/logger.hpp"

namespace calibration {

    std::string_view toString(const CalibrationStatus status) noexcept {
        switch (status) {
            case CalibrationStatus::Applied:
                return "applied";
            case CalibrationStatus::InvalidDepth:
                return "invalid depth sample";
            case CalibrationStatus::InvalidDistance:
                return "invalid reference distance";
            case CalibrationStatus::InvalidScale:
                return "invalid scale factor";
            case CalibrationStatus::NoDepthSample:
                return "no depth sample under the aim point";
        }
        return "unknown";
    }

    DepthCalibrator::DepthCalibrator(const double scale_factor) : scale_factor_(kDefaultScaleFactor) {
        if (restore(scale_factor) != CalibrationStatus::Applied) {
            LOG_WARN("Initial depth scale factor {} rejected, using {}", scale_factor, kDefaultScaleFactor);
        }
    }

    CalibrationStatus DepthCalibrator::calibrate(const double known_distance, const double measured_inverse_depth) {
        if (!std::isfinite(measured_inverse_depth) || measured_inverse_depth <= 0.0) {
            LOG_WARN("Calibration ignored: measured inverse depth {} must be positive", measured_inverse_depth);
            return CalibrationStatus::InvalidDepth;
        }
        if (!std::isfinite(known_distance) || known_distance <= 0.0) {
            LOG_WARN("Calibration ignored: reference distance {}m must be positive", known_distance);
            return CalibrationStatus::InvalidDistance;
        }

        scale_factor_ = known_distance * measured_inverse_depth;
        calibrated_at_ = types::Clock::now();
        LOG_INFO("Depth scale calibrated: {:.4f} ({}m at inverse depth {:.4f})", scale_factor_, known_distance,
                 measured_inverse_depth);
        return CalibrationStatus::Applied;
    }

    CalibrationStatus DepthCalibrator::restore(const double scale_factor) {
        if (!std::isfinite(scale_factor) || scale_factor <= 0.0) {
            return CalibrationStatus::InvalidScale;
        }
        scale_factor_ = scale_factor;
        return CalibrationStatus::Applied;
    }

} // namespace calibration
