// File: types/distance_unit.hpp

#ifndef DISTANCE_UNIT_HPP
#define DISTANCE_UNIT_HPP

#include <optional>
#include <string_view>

namespace types {

    enum class DistanceUnit { Meters, Yards, Feet };

    // Length of one unit in meters.
    [[nodiscard]] constexpr double metersPer(const DistanceUnit unit) noexcept {
        switch (unit) {
            case DistanceUnit::Meters:
                return 1.0;
            case DistanceUnit::Yards:
                return 0.9144;
            case DistanceUnit::Feet:
                return 0.3048;
        }
        return 1.0;
    }

    [[nodiscard]] constexpr double fromMeters(const double meters, const DistanceUnit unit) noexcept {
        return meters / metersPer(unit);
    }

    [[nodiscard]] constexpr double toMeters(const double value, const DistanceUnit unit) noexcept {
        return value * metersPer(unit);
    }

    [[nodiscard]] std::string_view symbol(DistanceUnit unit) noexcept;

    [[nodiscard]] std::optional<DistanceUnit> parseDistanceUnit(std::string_view text);

} // namespace types

#endif // DISTANCE_UNIT_HPP
