// File: ranging/size_based_ranger.cpp

#include "ranging/size_based_ranger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "common/formatting/fmt_ranging.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"

namespace ranging {

    SizeBasedRanger::Parameters SizeBasedRanger::Parameters::fromConfiguration() {
        Parameters parameters;
        parameters.min_pixel_size = config::get("ranging.size.min_pixel_size", parameters.min_pixel_size);
        parameters.min_distance = config::get("ranging.size.min_distance", parameters.min_distance);
        parameters.max_distance = config::get("ranging.size.max_distance", parameters.max_distance);
        return parameters;
    }

    SizeBasedRanger::SizeBasedRanger(std::shared_ptr<const knowledge::ObjectSizeLookup> lookup,
                                     Parameters parameters) :
        lookup_(std::move(lookup)), parameters_(parameters) {
        if (!lookup_) {
            throw std::invalid_argument("ObjectSizeLookup cannot be null");
        }
    }

    std::optional<types::RangeComponent> SizeBasedRanger::range(const types::Detection &detection,
                                                                const types::CameraIntrinsics &intrinsics) const {
        return estimate(detection, lookup_->lookup(detection.label), intrinsics);
    }

    std::vector<types::RangeComponent> SizeBasedRanger::rangeAll(const std::vector<types::Detection> &detections,
                                                                 const types::CameraIntrinsics &intrinsics) const {
        std::vector<types::RangeComponent> components;
        components.reserve(detections.size());
        for (const auto &detection: detections) {
            if (auto component = range(detection, intrinsics)) {
                components.push_back(std::move(*component));
            }
        }
        return components;
    }

    std::optional<types::RangeComponent> SizeBasedRanger::estimate(const types::Detection &detection,
                                                                   const std::optional<types::KnownObjectSize> &known,
                                                                   const types::CameraIntrinsics &intrinsics) const {
        if (!known) {
            LOG_TRACE("Unknown object '{}', no size-based range", detection.label);
            return std::nullopt;
        }
        if (!detection.isValid() || !intrinsics.isValid()) {
            LOG_DEBUG("Skipping {}: invalid detection or {}", detection, intrinsics);
            return std::nullopt;
        }

        const double pixel_size = pixelMeasurement(detection, known->axis);
        if (pixel_size < parameters_.min_pixel_size) {
            LOG_DEBUG("'{}' is {:.1f}px along {}, below {:.1f}px", detection.label, pixel_size, known->axis,
                      parameters_.min_pixel_size);
            return std::nullopt;
        }

        const double distance = distanceFromSize(known->size_meters, intrinsics.focalLength(known->axis), pixel_size);
        if (!std::isfinite(distance) || distance < parameters_.min_distance || distance > parameters_.max_distance) {
            LOG_DEBUG("'{}' range {:.2f}m outside [{}, {}]", detection.label, distance, parameters_.min_distance,
                      parameters_.max_distance);
            return std::nullopt;
        }

        const double score = confidence(detection, *known, pixel_size, distance);
        const double weight = std::clamp(score * known->reliability, 0.0, 1.0);

        types::RangeComponent component(types::methodFor(known->category), distance, score, weight, known->name(),
                                        fmt::format("{:.1f}m object at {:.0f}px", known->size_meters, pixel_size));
        LOG_DEBUG("Size-based component: {}", component);
        return component;
    }

    double SizeBasedRanger::pixelMeasurement(const types::Detection &detection, const types::MeasurementAxis axis) {
        switch (axis) {
            case types::MeasurementAxis::Height:
            case types::MeasurementAxis::ShoulderHeight:
                return detection.pixelHeight();
            case types::MeasurementAxis::Width:
                return detection.pixelWidth();
            case types::MeasurementAxis::Diagonal:
                return std::hypot(detection.pixelWidth(), detection.pixelHeight());
        }
        return detection.pixelHeight();
    }

    double SizeBasedRanger::distanceFromSize(const double real_size, const double focal_length,
                                             const double pixel_size) {
        // Similar triangles: real_size / distance == pixel_size / focal_length
        return real_size * focal_length / pixel_size;
    }

    double SizeBasedRanger::confidence(const types::Detection &detection, const types::KnownObjectSize &known,
                                       const double pixel_size, const double distance) {
        double confidence = detection.confidence;

        // Small boxes quantize badly.
        if (pixel_size < 50.0) {
            confidence *= pixel_size / 50.0;
        } else if (pixel_size < 100.0) {
            confidence *= 0.8 + (pixel_size - 50.0) / 250.0;
        }

        confidence *= 1.0 - known.variability * 0.5;

        // Unexpected box shape usually means occlusion or an unusual pose.
        const double expected_aspect = known.aspect_ratio;
        const double deviation = std::abs(detection.aspectRatio() - expected_aspect) / std::max(expected_aspect, 0.1);
        if (deviation > 0.5) {
            confidence *= 0.6;
        } else if (deviation > 0.3) {
            confidence *= 0.8;
        }

        if (distance > 500.0) {
            confidence *= 500.0 / distance;
        }

        if (!std::isfinite(confidence)) {
            return 0.0;
        }
        return std::clamp(confidence, 0.0, 1.0);
    }

} // namespace ranging
