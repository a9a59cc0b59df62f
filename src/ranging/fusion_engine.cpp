// File: ranging/fusion_engine.cpp

#include "ranging/fusion_engine.hpp"

#include <algorithm>
#include <cmath>

#include "common/formatting/fmt_ranging.hpp"
#include "common/logging/logger.hpp"
#include "config/configuration.hpp"

namespace ranging {

    FusionEngine::Parameters FusionEngine::Parameters::fromConfiguration() {
        Parameters parameters;
        parameters.uncertainty_floor = config::get("ranging.fusion.uncertainty_floor", parameters.uncertainty_floor);
        parameters.single_uncertainty_scale =
                config::get("ranging.fusion.single_uncertainty_scale", parameters.single_uncertainty_scale);
        return parameters;
    }

    std::optional<types::RangeEstimate> FusionEngine::fuse(const std::vector<types::RangeComponent> &components,
                                                           const types::Timestamp timestamp) const {
        std::optional<types::RangeEstimate> estimate;
        if (components.size() == 1) {
            estimate = fuseSingle(components.front());
        } else if (components.size() > 1) {
            estimate = fuseWeighted(components);
        }

        if (!estimate) {
            LOG_TRACE("Nothing to fuse ({} components)", components.size());
            return std::nullopt;
        }

        estimate->components = components;
        estimate->timestamp = timestamp;
        estimate->has_signal = true;
        LOG_DEBUG("Fused {} components: {:.2f}m ±{:.2f}m conf={:.3f}", components.size(), estimate->distance_meters,
                  estimate->uncertainty_meters, estimate->confidence);
        return estimate;
    }

    types::RangeEstimate FusionEngine::fuseSingle(const types::RangeComponent &component) const {
        types::RangeEstimate estimate;
        estimate.distance_meters = component.distance_meters;
        estimate.confidence = component.confidence;
        estimate.method = component.method;
        estimate.uncertainty_meters =
                component.distance_meters * (1.0 - component.confidence) * parameters_.single_uncertainty_scale;
        return estimate;
    }

    std::optional<types::RangeEstimate>
    FusionEngine::fuseWeighted(const std::vector<types::RangeComponent> &components) const {
        double total_weight = 0.0;
        double weighted_distance = 0.0;
        double weighted_confidence = 0.0;
        double max_confidence = 0.0;

        for (const auto &component: components) {
            const double weight = std::max(component.weight, 0.0);
            total_weight += weight;
            weighted_distance += component.distance_meters * weight;
            weighted_confidence += component.confidence * weight;
            max_confidence = std::max(max_confidence, component.confidence);
        }

        if (total_weight <= 0.0) {
            LOG_DEBUG("Total fusion weight is zero across {} components", components.size());
            return std::nullopt;
        }

        const double mean = weighted_distance / total_weight;

        double variance = 0.0;
        for (const auto &component: components) {
            const double difference = component.distance_meters - mean;
            variance += std::max(component.weight, 0.0) * difference * difference;
        }
        variance /= total_weight;

        types::RangeEstimate estimate;
        estimate.distance_meters = mean;
        estimate.uncertainty_meters = std::max(std::sqrt(variance), mean * parameters_.uncertainty_floor);
        estimate.confidence = std::clamp((max_confidence + weighted_confidence / total_weight) / 2.0, 0.0, 1.0);
        estimate.method = types::RangingMethod::Fused;
        return estimate;
    }

} // namespace ranging
