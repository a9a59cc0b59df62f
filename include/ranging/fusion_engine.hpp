// File: ranging/fusion_engine.hpp

#ifndef FUSION_ENGINE_HPP
#define FUSION_ENGINE_HPP

#include <optional>
#include <vector>

#include "types/range_component.hpp"
#include "types/range_estimate.hpp"

namespace ranging {

    /*
     * Combines candidate components into one estimate.
     *  - no components, or a zero total weight: std::nullopt (no signal)
     *  - one component: taken as is, uncertainty = d * (1 - c) * single_uncertainty_scale
     *  - several: weight-averaged distance, weighted standard deviation as uncertainty with a floor of
     *    uncertainty_floor * distance, confidence = (best + weighted mean confidence) / 2, method Fused
     * The result is the pre-smoothing estimate; temporal filtering is the caller's concern.
     */
    class FusionEngine {
    public:
        struct Parameters {
            double uncertainty_floor = 0.03;
            double single_uncertainty_scale = 0.2;

            [[nodiscard]] static Parameters fromConfiguration();
        };

        FusionEngine() : FusionEngine(Parameters{}) {}
        explicit FusionEngine(Parameters parameters) : parameters_(parameters) {}

        [[nodiscard]] std::optional<types::RangeEstimate> fuse(const std::vector<types::RangeComponent> &components,
                                                               types::Timestamp timestamp = types::Clock::now()) const;

        [[nodiscard]] const Parameters &parameters() const noexcept { return parameters_; }

    private:
        Parameters parameters_;

        [[nodiscard]] types::RangeEstimate fuseSingle(const types::RangeComponent &component) const;

        [[nodiscard]] std::optional<types::RangeEstimate>
        fuseWeighted(const std::vector<types::RangeComponent> &components) const;
    };

} // namespace ranging

#endif // FUSION_ENGINE_HPP
