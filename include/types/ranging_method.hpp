// File: types/ranging_method.hpp

#ifndef RANGING_METHOD_HPP
#define RANGING_METHOD_HPP

#include <string_view>

#include "types/object_category.hpp"

namespace types {

    enum class RangingMethod {
        SizeBasedHuman,
        SizeBasedVehicle,
        SizeBasedWildlife,
        SizeBasedStructure,
        SizeBasedSign,
        MonocularDepth,
        Fused
    };

    [[nodiscard]] constexpr RangingMethod methodFor(const ObjectCategory category) noexcept {
        switch (category) {
            case ObjectCategory::Human:
                return RangingMethod::SizeBasedHuman;
            case ObjectCategory::Vehicle:
                return RangingMethod::SizeBasedVehicle;
            case ObjectCategory::Wildlife:
                return RangingMethod::SizeBasedWildlife;
            case ObjectCategory::Structure:
                return RangingMethod::SizeBasedStructure;
            case ObjectCategory::Sign:
                return RangingMethod::SizeBasedSign;
        }
        return RangingMethod::SizeBasedStructure;
    }

    [[nodiscard]] constexpr bool isSizeBased(const RangingMethod method) noexcept {
        switch (method) {
            case RangingMethod::SizeBasedHuman:
            case RangingMethod::SizeBasedVehicle:
            case RangingMethod::SizeBasedWildlife:
            case RangingMethod::SizeBasedStructure:
            case RangingMethod::SizeBasedSign:
                return true;
            case RangingMethod::MonocularDepth:
            case RangingMethod::Fused:
                return false;
        }
        return false;
    }

    [[nodiscard]] std::string_view toString(RangingMethod method) noexcept;

} // namespace types

#endif // RANGING_METHOD_HPP
