// File: tests/api/range_publisher_test.cpp

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <vector>

#include "api/range_callback.hpp"
#include "api/range_publisher.hpp"

using namespace std::chrono_literals;

namespace {

    types::RangeEstimate estimateAt(const double distance) {
        types::RangeEstimate estimate;
        estimate.distance_meters = distance;
        estimate.has_signal = true;
        return estimate;
    }

} // namespace

TEST(RangePublisherTest, RejectsNullCallback) {
    EXPECT_THROW(api::RangePublisher publisher(nullptr), std::invalid_argument);
}

TEST(RangePublisherTest, DeliversSnapshotsToEveryCallback) {
    const auto callback = std::make_shared<api::RangeCallback>();
    int first = 0;
    double last_distance = -1.0;
    callback->registerCallback([&first](const types::RangeEstimate &) { ++first; });
    callback->registerCallback(
            [&last_distance](const types::RangeEstimate &estimate) { last_distance = estimate.distance_meters; });
    ASSERT_EQ(callback->size(), 2u);

    const api::RangePublisher publisher(callback);
    publisher.publish(estimateAt(42.0));
    publisher.publish(types::RangeEstimate::none());
    publisher.flush();

    EXPECT_EQ(first, 2);
    EXPECT_DOUBLE_EQ(last_distance, 0.0);
    EXPECT_EQ(publisher.dropped(), 0u);
}

TEST(RangePublisherTest, PreservesPublishOrder) {
    const auto callback = std::make_shared<api::RangeCallback>();
    std::vector<double> received;
    callback->registerCallback(
            [&received](const types::RangeEstimate &estimate) { received.push_back(estimate.distance_meters); });

    const api::RangePublisher publisher(callback, 64);
    for (int i = 1; i <= 20; ++i) {
        publisher.publish(estimateAt(i));
    }
    publisher.flush();

    ASSERT_EQ(received.size(), 20u);
    for (std::size_t i = 0; i < received.size(); ++i) {
        EXPECT_DOUBLE_EQ(received[i], static_cast<double>(i + 1));
    }
}

TEST(RangePublisherTest, PublishReturnsWhileTheConsumerIsBlocked) {
    const auto callback = std::make_shared<api::RangeCallback>();
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> delivered{0};
    callback->registerCallback([&entered, gate, &delivered](const types::RangeEstimate &) {
        if (delivered.fetch_add(1) == 0) {
            entered.set_value();
            gate.wait();
        }
    });

    const api::RangePublisher publisher(callback);
    publisher.publish(estimateAt(1.0));
    ASSERT_EQ(entered.get_future().wait_for(2s), std::future_status::ready);

    auto second = std::async(std::launch::async, [&publisher] { publisher.publish(estimateAt(2.0)); });
    EXPECT_EQ(second.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(delivered.load(), 1);

    release.set_value();
    publisher.flush();
    EXPECT_EQ(delivered.load(), 2);
}

TEST(RangePublisherTest, DropsTheOldestSnapshotWhenTheConsumerFallsBehind) {
    const auto callback = std::make_shared<api::RangeCallback>();
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::vector<double> received;
    callback->registerCallback([&entered, gate, &received](const types::RangeEstimate &estimate) {
        received.push_back(estimate.distance_meters);
        if (received.size() == 1) {
            entered.set_value();
            gate.wait();
        }
    });

    const api::RangePublisher publisher(callback, 2);
    publisher.publish(estimateAt(1.0));
    ASSERT_EQ(entered.get_future().wait_for(2s), std::future_status::ready);

    for (int i = 2; i <= 5; ++i) {
        publisher.publish(estimateAt(i));
    }
    EXPECT_EQ(publisher.dropped(), 2u);

    release.set_value();
    publisher.flush();
    EXPECT_EQ(received, (std::vector<double>{1.0, 4.0, 5.0}));
}

TEST(RangePublisherTest, DeliversPendingSnapshotsOnDestruction) {
    const auto callback = std::make_shared<api::RangeCallback>();
    std::atomic<int> delivered{0};
    callback->registerCallback([&delivered](const types::RangeEstimate &) { ++delivered; });

    {
        const api::RangePublisher publisher(callback);
        for (int i = 0; i < 5; ++i) {
            publisher.publish(estimateAt(i));
        }
    }
    EXPECT_EQ(delivered.load(), 5);
}

TEST(RangePublisherTest, CallbacksMayRegisterMoreCallbacks) {
    const auto callback = std::make_shared<api::RangeCallback>();
    callback->registerCallback([weak = std::weak_ptr<api::RangeCallback>(callback)](const types::RangeEstimate &) {
        if (const auto self = weak.lock()) {
            self->registerCallback([](const types::RangeEstimate &) {});
        }
    });

    const api::RangePublisher publisher(callback);
    publisher.publish(types::RangeEstimate::none());
    publisher.flush();
    EXPECT_EQ(callback->size(), 2u);
}
