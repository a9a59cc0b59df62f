// File: ranging/ranging_engine.cpp

#include "ranging/ranging_engine.hpp"

#include <utility>

#include "common/formatting/fmt_ranging.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"

namespace ranging {

    RangingEngine::Settings RangingEngine::Settings::fromConfiguration() {
        Settings settings;
        settings.depth_fusion_enabled = config::get("ranging.depth.enabled", settings.depth_fusion_enabled);
        settings.temporal_smoothing_enabled =
                config::get("ranging.smoothing.enabled", settings.temporal_smoothing_enabled);
        settings.reset_after_empty_frames =
                config::get("ranging.smoothing.reset_after_empty_frames", settings.reset_after_empty_frames);
        settings.history_size = config::get("ranging.history_size", settings.history_size);
        settings.lock_threshold = config::get("ranging.lock_threshold", settings.lock_threshold);
        settings.depth_scale_factor = config::get("ranging.depth.scale_factor", settings.depth_scale_factor);

        const std::string unit = config::get("display.unit", "yards");
        if (const auto parsed = types::parseDistanceUnit(unit)) {
            settings.display_unit = *parsed;
        } else {
            LOG_WARN("Unknown display unit '{}', keeping {}", unit, settings.display_unit);
        }

        settings.size = SizeBasedRanger::Parameters::fromConfiguration();
        settings.depth = DepthBasedRanger::Parameters::fromConfiguration();
        settings.fusion = FusionEngine::Parameters::fromConfiguration();
        settings.smoothing = filtering::KalmanFilter::Parameters::fromConfiguration();
        return settings;
    }

    RangingEngine::RangingEngine(std::shared_ptr<const knowledge::ObjectSizeLookup> lookup, Settings settings,
                                 std::shared_ptr<const api::Publisher> publisher) :
        lookup_(std::move(lookup)), publisher_(std::move(publisher)), size_ranger_(lookup_, settings.size),
        depth_ranger_(settings.depth), fusion_(settings.fusion), settings_(std::move(settings)),
        filter_(settings_.smoothing), calibrator_(settings_.depth_scale_factor), current_(types::RangeEstimate::none()) {
        current_.display_unit = settings_.display_unit;
        LOG_INFO("Ranging engine ready: depth fusion {}, smoothing {}, depth scale {:.4f}, unit {}",
                 settings_.depth_fusion_enabled ? "on" : "off", settings_.temporal_smoothing_enabled ? "on" : "off",
                 calibrator_.scaleFactor(), settings_.display_unit);
    }

    types::RangeEstimate RangingEngine::process(const types::FrameResult &frame) {
        types::RangeEstimate published;
        bool locked = false;
        {
            std::lock_guard lock(mutex_);

            const auto components = collectComponentsLocked(frame);
            auto fused = fusion_.fuse(components, frame.timestamp);

            if (fused) {
                empty_frames_ = 0;
                published = smoothLocked(std::move(*fused));
                history_.push_back(published);
                while (history_.size() > settings_.history_size) {
                    history_.pop_front();
                }
            } else {
                recordEmptyFrameLocked();
                published = types::RangeEstimate::none(frame.timestamp);
            }

            published.display_unit = settings_.display_unit;
            locked = published.isLocked(settings_.lock_threshold);
            current_ = published;
        }

        LOG_DEBUG("Frame processed: {} (locked: {})", published, locked);
        if (publisher_) {
            publisher_->publish(published);
        }
        return published;
    }

    std::vector<types::RangeComponent> RangingEngine::collectComponents(const types::FrameResult &frame) const {
        std::lock_guard lock(mutex_);
        return collectComponentsLocked(frame);
    }

    std::vector<types::RangeComponent> RangingEngine::collectComponentsLocked(const types::FrameResult &frame) const {
        if (!frame.detections.empty() && !frame.intrinsics.isValid()) {
            LOG_WARN("Frame has {} detections but unusable {}", frame.detections.size(), frame.intrinsics);
        }

        std::vector<types::RangeComponent> components = size_ranger_.rangeAll(frame.detections, frame.intrinsics);

        if (settings_.depth_fusion_enabled && frame.hasDepth()) {
            const auto target = selector_.select(frame.detections, frame.frame_size);
            if (auto depth_component =
                        depth_ranger_.range(frame.depth_map, target, frame.frame_size, calibrator_.scaleFactor())) {
                components.push_back(std::move(*depth_component));
            }
        }

        LOG_TRACE("Collected {} components from {} detections", components.size(), frame.detections.size());
        return components;
    }

    types::RangeEstimate RangingEngine::smoothLocked(types::RangeEstimate estimate) {
        if (!settings_.temporal_smoothing_enabled) {
            return estimate;
        }

        const double raw_distance = estimate.distance_meters;
        if (estimate.components.size() > 1) {
            estimate.distance_meters = filter_.update(raw_distance, estimate.uncertainty_meters);
        } else {
            estimate.distance_meters = filter_.update(raw_distance);
        }
        LOG_TRACE("Smoothed {:.2f}m -> {:.2f}m", raw_distance, estimate.distance_meters);
        return estimate;
    }

    void RangingEngine::recordEmptyFrameLocked() {
        ++empty_frames_;
        if (settings_.reset_after_empty_frames > 0 && empty_frames_ == settings_.reset_after_empty_frames) {
            LOG_INFO("No range signal for {} frames, resetting the temporal filter", empty_frames_);
            filter_.reset();
        }
    }

    calibration::CalibrationStatus RangingEngine::calibrate(const double known_distance,
                                                            const double measured_inverse_depth) {
        std::lock_guard lock(mutex_);
        return calibrator_.calibrate(known_distance, measured_inverse_depth);
    }

    std::optional<double> RangingEngine::sampleCalibrationDepth(const types::FrameResult &frame) const {
        std::lock_guard lock(mutex_);
        return sampleCalibrationDepthLocked(frame);
    }

    std::optional<double> RangingEngine::sampleCalibrationDepthLocked(const types::FrameResult &frame) const {
        if (!frame.hasDepth()) {
            LOG_WARN("Calibration frame carries no depth raster");
            return std::nullopt;
        }
        const auto target = selector_.select(frame.detections, frame.frame_size);
        return depth_ranger_.sampleInverseDepth(*frame.depth_map, target, frame.frame_size);
    }

    calibration::CalibrationStatus RangingEngine::calibrateFromFrame(const double known_distance,
                                                                     const types::FrameResult &frame) {
        std::lock_guard lock(mutex_);
        const auto inverse_depth = sampleCalibrationDepthLocked(frame);
        if (!inverse_depth) {
            LOG_WARN("No valid depth sample under the aim point, calibration skipped");
            return calibration::CalibrationStatus::NoDepthSample;
        }
        return calibrator_.calibrate(known_distance, *inverse_depth);
    }

    void RangingEngine::reset() {
        std::lock_guard lock(mutex_);
        filter_.reset();
        history_.clear();
        empty_frames_ = 0;
        current_ = types::RangeEstimate::none();
        current_.display_unit = settings_.display_unit;
        LOG_INFO("Ranging engine reset");
    }

    void RangingEngine::setDepthFusionEnabled(const bool enabled) {
        std::lock_guard lock(mutex_);
        settings_.depth_fusion_enabled = enabled;
    }

    void RangingEngine::setTemporalSmoothingEnabled(const bool enabled) {
        std::lock_guard lock(mutex_);
        if (enabled && !settings_.temporal_smoothing_enabled) {
            // The filter state is stale after running unsmoothed.
            filter_.reset();
        }
        settings_.temporal_smoothing_enabled = enabled;
    }

    void RangingEngine::setDisplayUnit(const types::DistanceUnit unit) {
        std::lock_guard lock(mutex_);
        settings_.display_unit = unit;
        current_.display_unit = unit;
    }

    double RangingEngine::depthScaleFactor() const {
        std::lock_guard lock(mutex_);
        return calibrator_.scaleFactor();
    }

    types::RangeEstimate RangingEngine::currentRange() const {
        std::lock_guard lock(mutex_);
        return current_;
    }

    bool RangingEngine::isTargetLocked() const {
        std::lock_guard lock(mutex_);
        return current_.isLocked(settings_.lock_threshold);
    }

    std::vector<types::RangeEstimate> RangingEngine::history() const {
        std::lock_guard lock(mutex_);
        return {history_.begin(), history_.end()};
    }

    double RangingEngine::smoothedDistance() const {
        std::lock_guard lock(mutex_);
        return filter_.estimate();
    }

    double RangingEngine::smoothedUncertainty() const {
        std::lock_guard lock(mutex_);
        return filter_.uncertainty();
    }

    std::size_t RangingEngine::consecutiveEmptyFrames() const {
        std::lock_guard lock(mutex_);
        return empty_frames_;
    }

} // namespace ranging
