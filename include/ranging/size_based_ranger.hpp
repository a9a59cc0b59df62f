// File: ranging/size_based_ranger.hpp

#ifndef SIZE_BASED_RANGER_HPP
#define SIZE_BASED_RANGER_HPP

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "knowledge/object_size_lookup.hpp"
#include "types/camera_intrinsics.hpp"
#include "types/detection.hpp"
#include "types/known_object_size.hpp"
#include "types/range_component.hpp"

namespace ranging {

    /*
     * Pinhole ranging from apparent size: distance = real_size * focal_length / pixel_size.
     * Detections without a known size, boxes smaller than min_pixel_size along the measured axis,
     * and distances outside [min_distance, max_distance] produce no component.
     */
    class SizeBasedRanger {
    public:
        struct Parameters {
            double min_pixel_size = 5.0;
            double min_distance = 1.0;
            double max_distance = 2000.0;

            [[nodiscard]] static Parameters fromConfiguration();
        };

        explicit SizeBasedRanger(std::shared_ptr<const knowledge::ObjectSizeLookup> lookup) :
            SizeBasedRanger(std::move(lookup), Parameters{}) {}
        explicit SizeBasedRanger(std::shared_ptr<const knowledge::ObjectSizeLookup> lookup, Parameters parameters);

        // Look up the detection's label and range it.
        [[nodiscard]] std::optional<types::RangeComponent> range(const types::Detection &detection,
                                                                 const types::CameraIntrinsics &intrinsics) const;

        // One component per detection that passes every guard, in input order.
        [[nodiscard]] std::vector<types::RangeComponent> rangeAll(const std::vector<types::Detection> &detections,
                                                                  const types::CameraIntrinsics &intrinsics) const;

        [[nodiscard]] std::optional<types::RangeComponent> estimate(const types::Detection &detection,
                                                                    const std::optional<types::KnownObjectSize> &known,
                                                                    const types::CameraIntrinsics &intrinsics) const;

        [[nodiscard]] static double pixelMeasurement(const types::Detection &detection, types::MeasurementAxis axis);

        [[nodiscard]] static double distanceFromSize(double real_size, double focal_length, double pixel_size);

        [[nodiscard]] static double confidence(const types::Detection &detection, const types::KnownObjectSize &known,
                                               double pixel_size, double distance);

        [[nodiscard]] const Parameters &parameters() const noexcept { return parameters_; }

    private:
        std::shared_ptr<const knowledge::ObjectSizeLookup> lookup_;
        Parameters parameters_;
    };

} // namespace ranging

#endif // SIZE_BASED_RANGER_HPP
