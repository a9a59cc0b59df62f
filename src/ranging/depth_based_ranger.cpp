// File: ranging/depth_based_ranger.cpp

#include "ranging/depth_based_ranger.hpp"

#include <algorithm>
#include <cmath>

#include "common/formatting/fmt_ranging.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"

namespace ranging {

    DepthBasedRanger::Parameters DepthBasedRanger::Parameters::fromConfiguration() {
        Parameters parameters;
        parameters.target_window = config::get("ranging.depth.target_window", parameters.target_window);
        parameters.center_window = config::get("ranging.depth.center_window", parameters.center_window);
        parameters.sample_stride = config::get("ranging.depth.sample_stride", parameters.sample_stride);
        parameters.min_distance = config::get("ranging.depth.min_distance", parameters.min_distance);
        parameters.max_distance = config::get("ranging.depth.max_distance", parameters.max_distance);
        parameters.confidence = config::get("ranging.depth.confidence", parameters.confidence);
        parameters.weight = config::get("ranging.depth.weight", parameters.weight);
        return parameters;
    }

    DepthBasedRanger::DepthBasedRanger(Parameters parameters) : parameters_(parameters) {
        parameters_.sample_stride = std::max(parameters_.sample_stride, 1);
        parameters_.confidence = std::clamp(parameters_.confidence, 0.0, 1.0);
        parameters_.weight = std::clamp(parameters_.weight, 0.0, 1.0);
    }

    std::optional<types::RangeComponent> DepthBasedRanger::range(const std::optional<cv::Mat> &depth_map,
                                                                 const std::optional<types::Detection> &target,
                                                                 const cv::Size &frame_size,
                                                                 const double scale_factor) const {
        if (!depth_map || depth_map->empty()) {
            return std::nullopt;
        }
        if (!std::isfinite(scale_factor) || scale_factor <= 0.0) {
            LOG_WARN("Depth scale factor {} is not usable", scale_factor);
            return std::nullopt;
        }

        const auto inverse_depth = sampleInverseDepth(*depth_map, target, frame_size);
        if (!inverse_depth) {
            return std::nullopt;
        }

        const double distance = scale_factor / *inverse_depth;
        if (!std::isfinite(distance) || distance < parameters_.min_distance || distance > parameters_.max_distance) {
            LOG_DEBUG("Depth range {:.2f}m outside [{}, {}]", distance, parameters_.min_distance,
                      parameters_.max_distance);
            return std::nullopt;
        }

        types::RangeComponent component(types::RangingMethod::MonocularDepth, distance, parameters_.confidence,
                                        parameters_.weight, std::nullopt, "AI depth estimation");
        LOG_DEBUG("Depth component: {} (median inverse depth {:.4f}, scale {:.3f})", component, *inverse_depth,
                  scale_factor);
        return component;
    }

    std::optional<double> DepthBasedRanger::sampleInverseDepth(const cv::Mat &depth_map,
                                                               const std::optional<types::Detection> &target,
                                                               const cv::Size &frame_size) const {
        if (depth_map.empty() || depth_map.channels() != 1) {
            LOG_WARN("Depth raster must be a non-empty single channel image (channels: {})", depth_map.channels());
            return std::nullopt;
        }
        if (frame_size.width <= 0 || frame_size.height <= 0) {
            LOG_WARN("Cannot map the sampling window into the depth raster: frame size {}x{}", frame_size.width,
                     frame_size.height);
            return std::nullopt;
        }

        cv::Mat depth32f;
        if (depth_map.depth() == CV_32F) {
            depth32f = depth_map;
        } else {
            depth_map.convertTo(depth32f, CV_32F);
        }

        const cv::Rect region = rasterWindow(sampleWindow(target, frame_size), frame_size, depth32f.size());
        if (region.empty()) {
            LOG_DEBUG("Sampling window falls outside the depth raster");
            return std::nullopt;
        }

        std::vector<float> samples = collectSamples(depth32f, region, parameters_.sample_stride);
        if (samples.empty()) {
            LOG_DEBUG("No valid depth samples in region [{}, {}, {}x{}]", region.x, region.y, region.width,
                      region.height);
            return std::nullopt;
        }

        LOG_TRACE("Collected {} depth samples", samples.size());
        return median(std::move(samples));
    }

    cv::Rect2d DepthBasedRanger::sampleWindow(const std::optional<types::Detection> &target,
                                              const cv::Size &frame_size) const {
        if (target) {
            const cv::Point2d center = target->pixelCenter();
            const double half = parameters_.target_window / 2.0;
            return {center.x - half, center.y - half, static_cast<double>(parameters_.target_window),
                    static_cast<double>(parameters_.target_window)};
        }

        const double half = parameters_.center_window / 2.0;
        return {frame_size.width / 2.0 - half, frame_size.height / 2.0 - half,
                static_cast<double>(parameters_.center_window), static_cast<double>(parameters_.center_window)};
    }

    cv::Rect DepthBasedRanger::rasterWindow(const cv::Rect2d &window, const cv::Size &frame_size,
                                            const cv::Size &raster_size) {
        if (frame_size.width <= 0 || frame_size.height <= 0) {
            return {};
        }

        const double scale_x = static_cast<double>(raster_size.width) / frame_size.width;
        const double scale_y = static_cast<double>(raster_size.height) / frame_size.height;

        const double left = window.x * scale_x;
        const double top = window.y * scale_y;
        const double right = (window.x + window.width) * scale_x;
        const double bottom = (window.y + window.height) * scale_y;
        if (!std::isfinite(left) || !std::isfinite(top) || !std::isfinite(right) || !std::isfinite(bottom)) {
            return {};
        }

        // Clamp before the integer conversion so far-off windows stay representable.
        const auto column = [&raster_size](const double value) {
            return static_cast<int>(std::clamp(value, 0.0, static_cast<double>(raster_size.width)));
        };
        const auto row = [&raster_size](const double value) {
            return static_cast<int>(std::clamp(value, 0.0, static_cast<double>(raster_size.height)));
        };

        const int x0 = column(std::floor(left));
        const int y0 = row(std::floor(top));
        const int x1 = column(std::ceil(right));
        const int y1 = row(std::ceil(bottom));
        if (x1 <= x0 || y1 <= y0) {
            return {};
        }
        return {x0, y0, x1 - x0, y1 - y0};
    }

    std::vector<float> DepthBasedRanger::collectSamples(const cv::Mat &depth32f, const cv::Rect &region,
                                                        const int stride) {
        std::vector<float> samples;
        const int step = std::max(stride, 1);
        samples.reserve(static_cast<std::size_t>((region.width / step + 1) * (region.height / step + 1)));

        for (int y = region.y; y < region.y + region.height; y += step) {
            const auto *row = depth32f.ptr<float>(y);
            for (int x = region.x; x < region.x + region.width; x += step) {
                const float value = row[x];
                if (std::isfinite(value) && value > 0.0f) {
                    samples.push_back(value);
                }
            }
        }
        return samples;
    }

    double DepthBasedRanger::median(std::vector<float> samples) {
        if (samples.empty()) {
            return 0.0;
        }
        const auto middle = samples.begin() + static_cast<std::ptrdiff_t>(samples.size() / 2);
        std::nth_element(samples.begin(), middle, samples.end());
        return *middle;
    }

} // namespace ranging
