// File: types/ranging_method.cpp

#include "types/ranging_method.hpp"

namespace types {

    std::string_view toString(const RangingMethod method) noexcept {
        switch (method) {
            case RangingMethod::SizeBasedHuman:
                return "Size (Human)";
            case RangingMethod::SizeBasedVehicle:
                return "Size (Vehicle)";
            case RangingMethod::SizeBasedWildlife:
                return "Size (Wildlife)";
            case RangingMethod::SizeBasedStructure:
                return "Size (Structure)";
            case RangingMethod::SizeBasedSign:
                return "Size (Sign)";
            case RangingMethod::MonocularDepth:
                return "Depth AI";
            case RangingMethod::Fused:
                return "Fused";
        }
        return "Unknown";
    }

} // namespace types
