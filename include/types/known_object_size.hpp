// File: types/known_object_size.hpp

#ifndef KNOWN_OBJECT_SIZE_HPP
#define KNOWN_OBJECT_SIZE_HPP

#include <string>

#include "types/object_category.hpp"

namespace types {

    // Real-world reference dimensions for a detector label.
    struct KnownObjectSize {
        std::string label;
        std::string display_name;
        ObjectCategory category{ObjectCategory::Human};
        MeasurementAxis axis{MeasurementAxis::Height};
        double size_meters{};
        double variability{};   // relative spread, [0, 1]
        double reliability{1.0}; // fusion weight multiplier, [0, 1]
        double aspect_ratio{1.0}; // expected width / height

        [[nodiscard]] const std::string &name() const noexcept { return display_name.empty() ? label : display_name; }
    };

} // namespace types

#endif // KNOWN_OBJECT_SIZE_HPP
