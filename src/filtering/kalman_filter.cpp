// File: filtering/kalman_filter.cpp

#include "filtering/kalman_filter.hpp"

#include <cmath>

#include "common/logging/logger.hpp"
#include "config/configuration.hpp"

namespace filtering {

    KalmanFilter::Parameters KalmanFilter::Parameters::fromConfiguration() {
        Parameters parameters;
        parameters.process_noise = config::get("ranging.smoothing.process_noise", parameters.process_noise);
        parameters.measurement_noise = config::get("ranging.smoothing.measurement_noise", parameters.measurement_noise);
        parameters.initial_variance = config::get("ranging.smoothing.initial_variance", parameters.initial_variance);
        return parameters;
    }

    KalmanFilter::KalmanFilter(Parameters parameters) :
        parameters_(parameters), variance_(parameters.initial_variance) {}

    double KalmanFilter::update(const double measurement, const std::optional<double> measurement_noise) {
        if (!std::isfinite(measurement)) {
            LOG_WARN("Rejecting non-finite measurement, keeping estimate {:.3f}", estimate_);
            return estimate_;
        }

        double noise = parameters_.measurement_noise;
        if (measurement_noise) {
            if (std::isfinite(*measurement_noise) && *measurement_noise >= 0.0) {
                noise = *measurement_noise;
            } else {
                LOG_WARN("Ignoring invalid measurement noise override {}", *measurement_noise);
            }
        }

        // Predict
        const double predicted_variance = variance_ + parameters_.process_noise;

        // Correct
        const double innovation_variance = predicted_variance + noise;
        const double gain = innovation_variance > 0.0 ? predicted_variance / innovation_variance : 1.0;
        estimate_ += gain * (measurement - estimate_);
        variance_ = (1.0 - gain) * predicted_variance;
        ++updates_;

        LOG_TRACE("Kalman update: z={:.3f}, r={:.3f}, gain={:.4f}, x={:.3f}, P={:.4f}", measurement, noise, gain,
                  estimate_, variance_);
        return estimate_;
    }

    void KalmanFilter::reset() noexcept {
        estimate_ = 0.0;
        variance_ = parameters_.initial_variance;
        updates_ = 0;
    }

    double KalmanFilter::uncertainty() const noexcept { return std::sqrt(variance_); }

} // namespace filtering
