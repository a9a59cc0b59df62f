// File: types/distance_unit.cpp

#include "types/distance_unit.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace types {

    std::string_view symbol(const DistanceUnit unit) noexcept {
        switch (unit) {
            case DistanceUnit::Meters:
                return "m";
            case DistanceUnit::Yards:
                return "yd";
            case DistanceUnit::Feet:
                return "ft";
        }
        return "";
    }

    std::optional<DistanceUnit> parseDistanceUnit(const std::string_view text) {
        std::string key(text);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (key == "m" || key == "meters" || key == "metres") {
            return DistanceUnit::Meters;
        }
        if (key == "yd" || key == "yards") {
            return DistanceUnit::Yards;
        }
        if (key == "ft" || key == "feet") {
            return DistanceUnit::Feet;
        }
        return std::nullopt;
    }

} // namespace types
