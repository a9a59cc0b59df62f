// File: tests/types/range_estimate_test.cpp

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "common/formatting/fmt_ranging.hpp"
#include "types/range_estimate.hpp"

using namespace types;

namespace {

    RangeEstimate estimateOf(const double distance, const double uncertainty, const double confidence) {
        RangeEstimate estimate;
        estimate.distance_meters = distance;
        estimate.uncertainty_meters = uncertainty;
        estimate.confidence = confidence;
        estimate.has_signal = true;
        return estimate;
    }

} // namespace

TEST(RangeEstimateTest, NoneIsDistinguishableFromAWeakMeasurement) {
    const auto none = RangeEstimate::none();
    EXPECT_FALSE(none.has_signal);
    EXPECT_DOUBLE_EQ(none.distance_meters, 0.0);
    EXPECT_DOUBLE_EQ(none.confidence, 0.0);
    EXPECT_DOUBLE_EQ(none.uncertaintyPercent(), 0.0);
    EXPECT_TRUE(none.components.empty());

    EXPECT_TRUE(estimateOf(10.0, 1.0, 0.0).has_signal);
}

TEST(RangeEstimateTest, QualityTiers) {
    EXPECT_EQ(estimateOf(100.0, 4.0, 0.85).quality(), RangeQuality::Excellent);
    EXPECT_EQ(estimateOf(100.0, 6.0, 0.85).quality(), RangeQuality::Good);
    EXPECT_EQ(estimateOf(100.0, 4.0, 0.7).quality(), RangeQuality::Good);
    EXPECT_EQ(estimateOf(100.0, 15.0, 0.7).quality(), RangeQuality::Fair);
    EXPECT_EQ(estimateOf(100.0, 25.0, 0.9).quality(), RangeQuality::Poor);
    EXPECT_EQ(estimateOf(100.0, 1.0, 0.4).quality(), RangeQuality::Poor);
    EXPECT_EQ(RangeEstimate::none().quality(), RangeQuality::Poor);
}

TEST(RangeEstimateTest, UncertaintyPercent) {
    EXPECT_DOUBLE_EQ(estimateOf(104.0, 8.0, 0.76).uncertaintyPercent(), 8.0 / 104.0 * 100.0);
    EXPECT_DOUBLE_EQ(estimateOf(0.0, 8.0, 0.76).uncertaintyPercent(), 0.0);
}

TEST(RangeEstimateTest, LockRequiresConfidenceAboveThreshold) {
    EXPECT_TRUE(estimateOf(50.0, 1.0, 0.51).isLocked());
    EXPECT_FALSE(estimateOf(50.0, 1.0, 0.5).isLocked());
    EXPECT_TRUE(estimateOf(50.0, 1.0, 0.5).isLocked(0.4));
}

TEST(RangeEstimateTest, ConvertsUnits) {
    const auto estimate = estimateOf(91.44, 9.144, 0.9);
    EXPECT_NEAR(estimate.distance(DistanceUnit::Yards), 100.0, 1e-9);
    EXPECT_NEAR(estimate.distance(DistanceUnit::Feet), 300.0, 1e-9);
    EXPECT_NEAR(estimate.uncertainty(DistanceUnit::Yards), 10.0, 1e-9);
    EXPECT_NEAR(toMeters(100.0, DistanceUnit::Yards), 91.44, 1e-9);
}

TEST(RangeEstimateTest, FormatsForDisplay) {
    auto estimate = estimateOf(91.44, 9.144, 0.9);
    estimate.display_unit = DistanceUnit::Yards;

    EXPECT_EQ(estimate.formattedDistance(), "100");
    EXPECT_EQ(estimate.formattedDistance(DistanceUnit::Meters, 1), "91.4");
    EXPECT_EQ(estimate.formattedUncertainty(), "±10");
    EXPECT_EQ(estimate.formattedUncertainty(DistanceUnit::Meters, 2), "±9.14");
}

TEST(RangeEstimateTest, FmtFormatter) {
    EXPECT_EQ(fmt::format("{}", RangeEstimate::none()), "RangeEstimate(none)");

    auto estimate = estimateOf(100.0, 8.0, 0.76);
    estimate.display_unit = DistanceUnit::Meters;
    const std::string text = fmt::format("{}", estimate);
    EXPECT_NE(text.find("100.0m"), std::string::npos) << text;
    EXPECT_NE(text.find("Good"), std::string::npos) << text;
}

TEST(DistanceUnitTest, ParsesNamesAndSymbols) {
    EXPECT_EQ(parseDistanceUnit("m"), DistanceUnit::Meters);
    EXPECT_EQ(parseDistanceUnit("Metres"), DistanceUnit::Meters);
    EXPECT_EQ(parseDistanceUnit("YARDS"), DistanceUnit::Yards);
    EXPECT_EQ(parseDistanceUnit("ft"), DistanceUnit::Feet);
    EXPECT_FALSE(parseDistanceUnit("furlongs").has_value());
    EXPECT_EQ(symbol(DistanceUnit::Yards), "yd");
}
