// File: types/object_category.hpp

#ifndef OBJECT_CATEGORY_HPP
#define OBJECT_CATEGORY_HPP

#include <optional>
#include <string>
#include <string_view>

namespace types {

    enum class ObjectCategory { Human, Vehicle, Wildlife, Structure, Sign };

    // Which dimension of the bounding box the known size corresponds to.
    enum class MeasurementAxis { Height, ShoulderHeight, Width, Diagonal };

    [[nodiscard]] std::string_view toString(ObjectCategory category) noexcept;

    [[nodiscard]] std::string_view toString(MeasurementAxis axis) noexcept;

    // Case-insensitive; accepts "shoulder_height" and "shoulder-height" alike.
    [[nodiscard]] std::optional<ObjectCategory> parseObjectCategory(std::string_view text);

    [[nodiscard]] std::optional<MeasurementAxis> parseMeasurementAxis(std::string_view text);

} // namespace types

#endif // OBJECT_CATEGORY_HPP
