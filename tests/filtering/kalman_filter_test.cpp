// File: tests/filtering/kalman_filter_test.cpp

#include <cmath>
#include <gtest/gtest.h>
#include <limits>

#include "filtering/kalman_filter.hpp"

using filtering::KalmanFilter;

TEST(KalmanFilterTest, StartsWithAnUninformativePrior) {
    const KalmanFilter filter;
    EXPECT_DOUBLE_EQ(filter.estimate(), 0.0);
    EXPECT_DOUBLE_EQ(filter.variance(), 100.0);
    EXPECT_DOUBLE_EQ(filter.uncertainty(), 10.0);
    EXPECT_EQ(filter.updates(), 0u);
}

TEST(KalmanFilterTest, FirstMeasurementDominates) {
    KalmanFilter filter;
    const double estimate = filter.update(10.0);

    const double gain = 100.5 / 102.5;
    EXPECT_NEAR(estimate, gain * 10.0, 1e-12);
    EXPECT_NEAR(filter.variance(), (1.0 - gain) * 100.5, 1e-12);
    EXPECT_EQ(filter.updates(), 1u);
}

TEST(KalmanFilterTest, ConvergesOnAConstantMeasurement) {
    for (const double z: {1.0, 15.87, 104.0, 950.0}) {
        KalmanFilter filter;
        for (int i = 0; i < 50; ++i) {
            filter.update(z);
        }
        EXPECT_NEAR(filter.estimate(), z, 0.01 * z) << "measurement " << z;
    }
}

TEST(KalmanFilterTest, MeasurementNoiseOverride) {
    KalmanFilter filter;
    EXPECT_DOUBLE_EQ(filter.update(42.0, 0.0), 42.0);
    EXPECT_DOUBLE_EQ(filter.variance(), 0.0);

    // A very noisy measurement barely moves the estimate.
    const double moved = filter.update(100.0, 1e6);
    EXPECT_NEAR(moved, 42.0, 0.1);
}

TEST(KalmanFilterTest, InvalidOverrideFallsBackToDefaultNoise) {
    KalmanFilter reference;
    KalmanFilter filter;
    EXPECT_DOUBLE_EQ(filter.update(10.0, -5.0), reference.update(10.0));
    EXPECT_DOUBLE_EQ(filter.update(12.0, std::numeric_limits<double>::quiet_NaN()), reference.update(12.0));
}

TEST(KalmanFilterTest, RejectsNonFiniteMeasurements) {
    KalmanFilter filter;
    filter.update(20.0);
    const double estimate = filter.estimate();
    const double variance = filter.variance();

    EXPECT_DOUBLE_EQ(filter.update(std::numeric_limits<double>::infinity()), estimate);
    EXPECT_DOUBLE_EQ(filter.update(std::numeric_limits<double>::quiet_NaN()), estimate);
    EXPECT_DOUBLE_EQ(filter.variance(), variance);
    EXPECT_EQ(filter.updates(), 1u);
}

TEST(KalmanFilterTest, ResetRestoresThePrior) {
    KalmanFilter filter;
    for (int i = 0; i < 10; ++i) {
        filter.update(300.0);
    }
    filter.reset();

    EXPECT_DOUBLE_EQ(filter.estimate(), 0.0);
    EXPECT_DOUBLE_EQ(filter.uncertainty(), 10.0);
    EXPECT_EQ(filter.updates(), 0u);
}

TEST(KalmanFilterTest, UsesConfiguredNoise) {
    KalmanFilter filter(KalmanFilter::Parameters{0.0, 100.0, 100.0});
    EXPECT_NEAR(filter.update(10.0), 5.0, 1e-12);
    EXPECT_NEAR(filter.variance(), 50.0, 1e-12);
}
