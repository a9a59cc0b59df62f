// File: types/range_estimate.cpp

#include "types/range_estimate.hpp"

#include <fmt/format.h>

namespace types {

    std::string_view toString(const RangeQuality quality) noexcept {
        switch (quality) {
            case RangeQuality::Excellent:
                return "Excellent";
            case RangeQuality::Good:
                return "Good";
            case RangeQuality::Fair:
                return "Fair";
            case RangeQuality::Poor:
                return "Poor";
        }
        return "Poor";
    }

    RangeEstimate RangeEstimate::none(const Timestamp timestamp) {
        RangeEstimate estimate;
        estimate.timestamp = timestamp;
        return estimate;
    }

    double RangeEstimate::uncertaintyPercent() const noexcept {
        if (distance_meters <= 0.0) {
            return 0.0;
        }
        return uncertainty_meters / distance_meters * 100.0;
    }

    RangeQuality RangeEstimate::quality() const noexcept {
        const double percent = uncertaintyPercent();
        if (confidence > 0.8 && percent < 5.0) {
            return RangeQuality::Excellent;
        }
        if (confidence > 0.6 && percent < 10.0) {
            return RangeQuality::Good;
        }
        if (confidence > 0.4 && percent < 20.0) {
            return RangeQuality::Fair;
        }
        return RangeQuality::Poor;
    }

    std::string RangeEstimate::formattedDistance(const int precision) const {
        return formattedDistance(display_unit, precision);
    }

    std::string RangeEstimate::formattedDistance(const DistanceUnit unit, const int precision) const {
        return fmt::format("{:.{}f}", distance(unit), precision);
    }

    std::string RangeEstimate::formattedUncertainty(const int precision) const {
        return formattedUncertainty(display_unit, precision);
    }

    std::string RangeEstimate::formattedUncertainty(const DistanceUnit unit, const int precision) const {
        return fmt::format("±{:.{}f}", uncertainty(unit), precision);
    }

} // namespace types
