// File: ranging/ranging_engine.hpp

#ifndef RANGING_ENGINE_HPP
#define RANGING_ENGINE_HPP

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "api/interface/publisher.hpp"
#include "calibration/depth_calibrator.hpp"
#include "filtering/kalman_filter.hpp"
#include "knowledge/object_size_lookup.hpp"
#include "ranging/depth_based_ranger.hpp"
#include "ranging/fusion_engine.hpp"
#include "ranging/primary_detection_selector.hpp"
#include "ranging/size_based_ranger.hpp"
#include "types/distance_unit.hpp"
#include "types/frame_result.hpp"
#include "types/range_component.hpp"
#include "types/range_estimate.hpp"

namespace ranging {

    /*
     * Runs one ranging cycle per frame:
     *   detections -> size-based components, primary detection -> depth component,
     *   components -> fusion -> Kalman smoothing -> published estimate.
     *
     * The Kalman state, the depth scale factor and the history are the only state kept between
     * frames. All of it is guarded by one mutex, so an engine may be shared between threads, but
     * calls are serialized. Publishing happens after the lock is released.
     *
     * A frame without any component returns the "none" estimate and leaves the filter untouched.
     * After reset_after_empty_frames consecutive such frames the filter is reset (0 disables this).
     */
    class RangingEngine {
    public:
        struct Settings {
            bool depth_fusion_enabled = true;
            bool temporal_smoothing_enabled = true;
            std::size_t reset_after_empty_frames = 15;
            std::size_t history_size = 10;
            double lock_threshold = 0.5;
            double depth_scale_factor = calibration::DepthCalibrator::kDefaultScaleFactor;
            types::DistanceUnit display_unit = types::DistanceUnit::Yards;

            SizeBasedRanger::Parameters size;
            DepthBasedRanger::Parameters depth;
            FusionEngine::Parameters fusion;
            filtering::KalmanFilter::Parameters smoothing;

            [[nodiscard]] static Settings fromConfiguration();
        };

        explicit RangingEngine(std::shared_ptr<const knowledge::ObjectSizeLookup> lookup, Settings settings = {},
                               std::shared_ptr<const api::Publisher> publisher = nullptr);

        RangingEngine(const RangingEngine &) = delete;

        RangingEngine &operator=(const RangingEngine &) = delete;

        types::RangeEstimate process(const types::FrameResult &frame);

        // Candidate components for a frame without touching the filter.
        [[nodiscard]] std::vector<types::RangeComponent> collectComponents(const types::FrameResult &frame) const;

        [[nodiscard]] calibration::CalibrationStatus calibrate(double known_distance, double measured_inverse_depth);

        // Median inverse depth under the aim point (primary detection or frame center).
        [[nodiscard]] std::optional<double> sampleCalibrationDepth(const types::FrameResult &frame) const;

        // Sample the inverse depth under the aim point of a frame and calibrate against it.
        [[nodiscard]] calibration::CalibrationStatus calibrateFromFrame(double known_distance,
                                                                        const types::FrameResult &frame);

        // Forget the tracked target: filter, history and current estimate.
        void reset();

        void setDepthFusionEnabled(bool enabled);

        void setTemporalSmoothingEnabled(bool enabled);

        void setDisplayUnit(types::DistanceUnit unit);

        [[nodiscard]] double depthScaleFactor() const;

        [[nodiscard]] types::RangeEstimate currentRange() const;

        [[nodiscard]] bool isTargetLocked() const;

        [[nodiscard]] std::vector<types::RangeEstimate> history() const;

        [[nodiscard]] double smoothedDistance() const;

        [[nodiscard]] double smoothedUncertainty() const;

        [[nodiscard]] std::size_t consecutiveEmptyFrames() const;

    private:
        std::shared_ptr<const knowledge::ObjectSizeLookup> lookup_;
        std::shared_ptr<const api::Publisher> publisher_;

        PrimaryDetectionSelector selector_;
        SizeBasedRanger size_ranger_;
        DepthBasedRanger depth_ranger_;
        FusionEngine fusion_;

        mutable std::mutex mutex_;
        Settings settings_;
        filtering::KalmanFilter filter_;
        calibration::DepthCalibrator calibrator_;
        types::RangeEstimate current_;
        std::deque<types::RangeEstimate> history_;
        std::size_t empty_frames_ = 0;

        [[nodiscard]] std::vector<types::RangeComponent> collectComponentsLocked(const types::FrameResult &frame) const;

        [[nodiscard]] types::RangeEstimate smoothLocked(types::RangeEstimate estimate);

        void recordEmptyFrameLocked();

        [[nodiscard]] std::optional<double> sampleCalibrationDepthLocked(const types::FrameResult &frame) const;
    };

} // namespace ranging

#endif // RANGING_ENGINE_HPP
