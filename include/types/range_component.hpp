// File: types/range_component.hpp

#ifndef RANGE_COMPONENT_HPP
#define RANGE_COMPONENT_HPP

#include <optional>
#include <string>
#include <utility>

#include "types/distance_unit.hpp"
#include "types/ranging_method.hpp"

namespace types {

    // A single candidate distance produced by one ranging method.
    struct RangeComponent {
        RangingMethod method{RangingMethod::Fused};
        double distance_meters{};
        double confidence{};
        double weight{};
        std::optional<std::string> label;
        std::string details;

        RangeComponent() = default;

        RangeComponent(const RangingMethod method, const double distance_meters, const double confidence,
                       const double weight, std::optional<std::string> label = std::nullopt, std::string details = {}) :
            method(method), distance_meters(distance_meters), confidence(confidence), weight(weight),
            label(std::move(label)), details(std::move(details)) {}

        [[nodiscard]] double distance(const DistanceUnit unit) const noexcept {
            return fromMeters(distance_meters, unit);
        }
    };

} // namespace types

#endif // RANGE_COMPONENT_HPP
