// File: types/range_estimate.hpp

#ifndef RANGE_ESTIMATE_HPP
#define RANGE_ESTIMATE_HPP

#include <string>
#include <string_view>
#include <vector>

#include "types/detection.hpp"
#include "types/distance_unit.hpp"
#include "types/range_component.hpp"
#include "types/ranging_method.hpp"

namespace types {

    enum class RangeQuality { Excellent, Good, Fair, Poor };

    [[nodiscard]] std::string_view toString(RangeQuality quality) noexcept;

    /*
     * Published result of one ranging cycle. Distances are stored in meters; display_unit
     * only selects how the estimate is rendered. has_signal is false for the "no estimate"
     * sentinel so it cannot be mistaken for a real low-confidence measurement.
     */
    struct RangeEstimate {
        double distance_meters{};
        double confidence{};
        RangingMethod method{RangingMethod::Fused};
        double uncertainty_meters{};
        std::vector<RangeComponent> components;
        Timestamp timestamp{};
        DistanceUnit display_unit{DistanceUnit::Meters};
        bool has_signal{false};

        [[nodiscard]] static RangeEstimate none(Timestamp timestamp = Clock::now());

        [[nodiscard]] double distance(const DistanceUnit unit) const noexcept {
            return fromMeters(distance_meters, unit);
        }

        [[nodiscard]] double uncertainty(const DistanceUnit unit) const noexcept {
            return fromMeters(uncertainty_meters, unit);
        }

        // Uncertainty relative to distance, in percent. 0 when the distance is 0.
        [[nodiscard]] double uncertaintyPercent() const noexcept;

        [[nodiscard]] RangeQuality quality() const noexcept;

        [[nodiscard]] bool isLocked(double threshold = 0.5) const noexcept { return confidence > threshold; }

        [[nodiscard]] std::string formattedDistance(int precision = 0) const;

        [[nodiscard]] std::string formattedDistance(DistanceUnit unit, int precision = 0) const;

        [[nodiscard]] std::string formattedUncertainty(int precision = 0) const;

        [[nodiscard]] std::string formattedUncertainty(DistanceUnit unit, int precision = 0) const;
    };

} // namespace types

#endif // RANGE_ESTIMATE_HPP
