// File: tests/ranging/primary_detection_selector_test.cpp

#include <gtest/gtest.h>
#include <limits>

#include "ranging/primary_detection_selector.hpp"

using namespace ranging;

class PrimaryDetectionSelectorTest : public ::testing::Test {
protected:
    PrimaryDetectionSelector selector;
    const cv::Size frame_size{1000, 1000};
};

TEST_F(PrimaryDetectionSelectorTest, EmptyInputSelectsNothing) {
    EXPECT_FALSE(selector.select({}, frame_size).has_value());
    EXPECT_FALSE(selector.selectIndex({}, frame_size).has_value());
}

TEST_F(PrimaryDetectionSelectorTest, ScoreFavoursTheAimPoint) {
    const types::Detection centered("person", 0.5, cv::Rect2d(450, 450, 100, 100));
    EXPECT_NEAR(PrimaryDetectionSelector::score(centered, frame_size), 5.0, 1e-9);

    // Normalized center (0.8, 0.9): offset 0.5
    const types::Detection corner("person", 0.9, cv::Rect2d(750, 850, 100, 100));
    EXPECT_NEAR(PrimaryDetectionSelector::score(corner, frame_size), 0.9 / 0.6, 1e-9);
}

TEST_F(PrimaryDetectionSelectorTest, CenteredBeatsMoreConfidentOffCenter) {
    const std::vector<types::Detection> detections = {
            {"car", 0.95, cv::Rect2d(0, 0, 100, 100)},
            {"person", 0.6, cv::Rect2d(480, 470, 40, 60)},
            {"dog", 0.9, cv::Rect2d(850, 850, 100, 100)},
    };

    const auto index = selector.selectIndex(detections, frame_size);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(*index, 1u);

    const auto selected = selector.select(detections, frame_size);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected->label, "person");
}

TEST_F(PrimaryDetectionSelectorTest, TiesKeepTheFirstDetection) {
    // Mirror images around the aim point score identically.
    const std::vector<types::Detection> detections = {
            {"left", 0.8, cv::Rect2d(200, 450, 100, 100)},
            {"right", 0.8, cv::Rect2d(700, 450, 100, 100)},
    };
    ASSERT_EQ(PrimaryDetectionSelector::score(detections[0], frame_size),
              PrimaryDetectionSelector::score(detections[1], frame_size));

    EXPECT_EQ(selector.selectIndex(detections, frame_size), std::optional<std::size_t>(0));

    const std::vector<types::Detection> reversed = {detections[1], detections[0]};
    EXPECT_EQ(selector.select(reversed, frame_size)->label, "right");
}

TEST_F(PrimaryDetectionSelectorTest, InvalidDetectionsAreSkipped) {
    const std::vector<types::Detection> detections = {
            {"ghost", std::numeric_limits<double>::quiet_NaN(), cv::Rect2d(450, 450, 100, 100)},
            {"flat", 0.9, cv::Rect2d(450, 450, 100, 0)},
            {"person", 0.3, cv::Rect2d(0, 0, 50, 100)},
    };

    const auto selected = selector.select(detections, frame_size);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(selected->label, "person");
}

TEST_F(PrimaryDetectionSelectorTest, DegenerateFrameSizeStillSelects) {
    const std::vector<types::Detection> detections = {{"person", 0.9, cv::Rect2d(0, 0, 1, 1)}};
    EXPECT_TRUE(selector.select(detections, cv::Size()).has_value());
}
