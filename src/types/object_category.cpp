// File: types/object_category.cpp

#include "types/object_category.hpp"

#include <algorithm>
#include <cctype>

namespace types {

    namespace {
        std::string normalize(std::string_view text) {
            std::string normalized(text);
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](const unsigned char c) {
                return c == '-' || c == ' ' ? '_' : static_cast<char>(std::tolower(c));
            });
            return normalized;
        }
    } // namespace

    std::string_view toString(const ObjectCategory category) noexcept {
        switch (category) {
            case ObjectCategory::Human:
                return "human";
            case ObjectCategory::Vehicle:
                return "vehicle";
            case ObjectCategory::Wildlife:
                return "wildlife";
            case ObjectCategory::Structure:
                return "structure";
            case ObjectCategory::Sign:
                return "sign";
        }
        return "unknown";
    }

    std::string_view toString(const MeasurementAxis axis) noexcept {
        switch (axis) {
            case MeasurementAxis::Height:
                return "height";
            case MeasurementAxis::ShoulderHeight:
                return "shoulder_height";
            case MeasurementAxis::Width:
                return "width";
            case MeasurementAxis::Diagonal:
                return "diagonal";
        }
        return "unknown";
    }

    std::optional<ObjectCategory> parseObjectCategory(const std::string_view text) {
        const std::string key = normalize(text);
        for (const auto category: {ObjectCategory::Human, ObjectCategory::Vehicle, ObjectCategory::Wildlife,
                                   ObjectCategory::Structure, ObjectCategory::Sign}) {
            if (key == toString(category)) {
                return category;
            }
        }
        return std::nullopt;
    }

    std::optional<MeasurementAxis> parseMeasurementAxis(const std::string_view text) {
        const std::string key = normalize(text);
        for (const auto axis: {MeasurementAxis::Height, MeasurementAxis::ShoulderHeight, MeasurementAxis::Width,
                               MeasurementAxis::Diagonal}) {
            if (key == toString(axis)) {
                return axis;
            }
        }
        return std::nullopt;
    }

} // namespace types
