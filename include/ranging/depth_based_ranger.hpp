// File: ranging/depth_based_ranger.hpp

#ifndef DEPTH_BASED_RANGER_HPP
#define DEPTH_BASED_RANGER_HPP

#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "types/detection.hpp"
#include "types/range_component.hpp"

namespace ranging {

    /*
     * Converts the relative inverse-depth raster into an absolute distance:
     *   distance = scale_factor / median(inverse depth under the aim point)
     *
     * The window is centered on the target detection (target_window px square) or, without a
     * target, on the frame center (center_window px square). It is given in frame pixels and
     * rescaled per axis to the raster resolution before sampling every sample_stride-th pixel.
     * Only finite, positive samples count. The scale factor comes from calibration.
     */
    class DepthBasedRanger {
    public:
        struct Parameters {
            int target_window = 50;
            int center_window = 100;
            int sample_stride = 4;
            double min_distance = 0.5;
            double max_distance = 2000.0;
            double confidence = 0.5;
            double weight = 0.3;

            [[nodiscard]] static Parameters fromConfiguration();
        };

        DepthBasedRanger() : DepthBasedRanger(Parameters{}) {}
        explicit DepthBasedRanger(Parameters parameters);

        [[nodiscard]] std::optional<types::RangeComponent> range(const std::optional<cv::Mat> &depth_map,
                                                                 const std::optional<types::Detection> &target,
                                                                 const cv::Size &frame_size,
                                                                 double scale_factor) const;

        // Median inverse depth inside the sampling window, if any valid sample exists.
        [[nodiscard]] std::optional<double> sampleInverseDepth(const cv::Mat &depth_map,
                                                               const std::optional<types::Detection> &target,
                                                               const cv::Size &frame_size) const;

        // Sampling window in frame pixels.
        [[nodiscard]] cv::Rect2d sampleWindow(const std::optional<types::Detection> &target,
                                              const cv::Size &frame_size) const;

        // Window rescaled into raster pixels and clipped to the raster bounds.
        [[nodiscard]] static cv::Rect rasterWindow(const cv::Rect2d &window, const cv::Size &frame_size,
                                                   const cv::Size &raster_size);

        [[nodiscard]] static std::vector<float> collectSamples(const cv::Mat &depth32f, const cv::Rect &region,
                                                               int stride);

        // Upper median (element n/2 after sorting); 0 for an empty input.
        [[nodiscard]] static double median(std::vector<float> samples);

        [[nodiscard]] const Parameters &parameters() const noexcept { return parameters_; }

    private:
        Parameters parameters_;
    };

} // namespace ranging

#endif // DEPTH_BASED_RANGER_HPP
