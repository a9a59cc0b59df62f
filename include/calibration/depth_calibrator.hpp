// File: calibration/depth_calibrator.hpp

#ifndef DEPTH_CALIBRATOR_HPP
#define DEPTH_CALIBRATOR_HPP

#include <optional>
#include <string_view>

#include "types/detection.hpp"

namespace calibration {

    enum class CalibrationStatus { Applied, InvalidDepth, InvalidDistance, InvalidScale, NoDepthSample };

    [[nodiscard]] std::string_view toString(CalibrationStatus status) noexcept;

    /*
     * Holds the factor that turns relative inverse depth into meters (distance = scale / inverse_depth).
     * A single ground-truth pair fixes it: scale = known_distance * measured_inverse_depth.
     * Rejected calibrations leave the previous factor in place.
     */
    class DepthCalibrator {
    public:
        static constexpr double kDefaultScaleFactor = 1.0;

        explicit DepthCalibrator(double scale_factor = kDefaultScaleFactor);

        [[nodiscard]] CalibrationStatus calibrate(double known_distance, double measured_inverse_depth);

        // Restore a factor persisted by the caller.
        [[nodiscard]] CalibrationStatus restore(double scale_factor);

        [[nodiscard]] double scaleFactor() const noexcept { return scale_factor_; }

        [[nodiscard]] bool isCalibrated() const noexcept { return calibrated_at_.has_value(); }

        [[nodiscard]] std::optional<types::Timestamp> calibratedAt() const noexcept { return calibrated_at_; }

    private:
        double scale_factor_;
        std::optional<types::Timestamp> calibrated_at_;
    };

} // namespace calibration

#endif // DEPTH_CALIBRATOR_HPP
