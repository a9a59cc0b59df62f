// File: common/formatting/fmt_ranging.hpp

#ifndef COMMON_FORMATTING_FMT_RANGING_HPP
#define COMMON_FORMATTING_FMT_RANGING_HPP

#include <string_view>

#include <fmt/format.h>

#include "types/camera_intrinsics.hpp"
#include "types/detection.hpp"
#include "types/distance_unit.hpp"
#include "types/object_category.hpp"
#include "types/range_component.hpp"
#include "types/range_estimate.hpp"
#include "types/ranging_method.hpp"

/*
 * fmt formatters for the ranging types so they can be passed straight to LOG_* macros.
 * Enumerations render through their toString() names and accept string_view specs.
 */

template<>
struct fmt::formatter<types::RangingMethod> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const types::RangingMethod method, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(types::toString(method), ctx);
    }
};

template<>
struct fmt::formatter<types::ObjectCategory> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const types::ObjectCategory category, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(types::toString(category), ctx);
    }
};

template<>
struct fmt::formatter<types::MeasurementAxis> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const types::MeasurementAxis axis, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(types::toString(axis), ctx);
    }
};

template<>
struct fmt::formatter<types::RangeQuality> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const types::RangeQuality quality, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(types::toString(quality), ctx);
    }
};

template<>
struct fmt::formatter<types::DistanceUnit> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const types::DistanceUnit unit, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(types::symbol(unit), ctx);
    }
};

template<>
struct fmt::formatter<types::Detection> {
    constexpr auto parse(fmt::format_parse_context &ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const types::Detection &detection, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "Detection('{}', conf={:.2f}, box=[{:.1f}, {:.1f}, {:.1f}x{:.1f}])",
                              detection.label, detection.confidence, detection.box.x, detection.box.y,
                              detection.box.width, detection.box.height);
    }
};

template<>
struct fmt::formatter<types::CameraIntrinsics> {
    constexpr auto parse(fmt::format_parse_context &ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const types::CameraIntrinsics &intrinsics, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "Intrinsics(fx={:.1f}, fy={:.1f}, cx={:.1f}, cy={:.1f}, ref={}x{})",
                              intrinsics.fx, intrinsics.fy, intrinsics.cx, intrinsics.cy,
                              intrinsics.reference_size.width, intrinsics.reference_size.height);
    }
};

template<>
struct fmt::formatter<types::RangeComponent> {
    constexpr auto parse(fmt::format_parse_context &ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const types::RangeComponent &component, FormatContext &ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}[{}] {:.2f}m conf={:.3f} weight={:.3f} ({})", component.method,
                              component.label.value_or("-"), component.distance_meters, component.confidence,
                              component.weight, component.details);
    }
};

template<>
struct fmt::formatter<types::RangeEstimate> {
    constexpr auto parse(fmt::format_parse_context &ctx) -> decltype(ctx.begin()) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const types::RangeEstimate &estimate, FormatContext &ctx) const -> decltype(ctx.out()) {
        if (!estimate.has_signal) {
            return fmt::format_to(ctx.out(), "RangeEstimate(none)");
        }
        return fmt::format_to(ctx.out(), "RangeEstimate({}{} {}{}, conf={:.3f}, {}, {} components, {})",
                              estimate.formattedDistance(1), estimate.display_unit,
                              estimate.formattedUncertainty(1), estimate.display_unit, estimate.confidence,
                              estimate.method, estimate.components.size(), estimate.quality());
    }
};

#endif // COMMON_FORMATTING_FMT_RANGING_HPP
