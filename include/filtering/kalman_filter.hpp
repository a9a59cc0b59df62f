// File: filtering/kalman_filter.hpp

#ifndef KALMAN_FILTER_HPP
#define KALMAN_FILTER_HPP

#include <cstddef>
#include <optional>

namespace filtering {

    /*
     * Scalar Kalman filter with a constant-position model, used to smooth range measurements
     * across frames. The prior is deliberately uninformative (variance 100) so the first
     * measurement dominates. The filter never resets itself; the owner calls reset() when the
     * target or scene changes.
     */
    class KalmanFilter {
    public:
        struct Parameters {
            double process_noise = 0.5;     // m^2 per update
            double measurement_noise = 2.0; // m^2, used when update() gets no override
            double initial_variance = 100.0;

            [[nodiscard]] static Parameters fromConfiguration();
        };

        KalmanFilter() : KalmanFilter(Parameters{}) {}
        explicit KalmanFilter(Parameters parameters);

        // Returns the new estimate. Non-finite measurements are rejected and leave the state unchanged.
        double update(double measurement, std::optional<double> measurement_noise = std::nullopt);

        void reset() noexcept;

        [[nodiscard]] double estimate() const noexcept { return estimate_; }
        [[nodiscard]] double variance() const noexcept { return variance_; }
        [[nodiscard]] double uncertainty() const noexcept;
        [[nodiscard]] std::size_t updates() const noexcept { return updates_; }

        [[nodiscard]] const Parameters &parameters() const noexcept { return parameters_; }

    private:
        Parameters parameters_;
        double estimate_ = 0.0;
        double variance_;
        std::size_t updates_ = 0;
    };

} // namespace filtering

#endif // KALMAN_FILTER_HPP
