// File: api/range_publisher.hpp

#ifndef RANGE_PUBLISHER_HPP
#define RANGE_PUBLISHER_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

#include "api/interface/publisher.hpp"
#include "api/range_callback.hpp"
#include "types/range_estimate.hpp"

namespace api {

    /*
     * Hands range snapshots to the registered callbacks on a dispatch thread owned by the publisher,
     * so publish() never waits on a consumer. Snapshots are delivered in publish order. When the
     * consumer falls behind by more than `capacity` snapshots the oldest pending one is dropped.
     * Pending snapshots are still delivered when the publisher is destroyed.
     */
    class RangePublisher : public Publisher {
    public:
        static constexpr std::size_t default_capacity = 16;

        explicit RangePublisher(std::shared_ptr<RangeCallback> callback, std::size_t capacity = default_capacity);

        RangePublisher(const RangePublisher &) = delete;

        RangePublisher &operator=(const RangePublisher &) = delete;

        ~RangePublisher() override;

        void publish(const types::RangeEstimate &estimate) const override;

        // Blocks until every snapshot published so far has been delivered. Not callable from a callback.
        void flush() const;

        [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
        [[nodiscard]] std::size_t dropped() const;

    private:
        std::shared_ptr<RangeCallback> callback_;
        std::size_t capacity_;

        mutable std::mutex mutex_;
        mutable std::condition_variable pending_cv_;
        mutable std::condition_variable idle_cv_;
        mutable std::deque<types::RangeEstimate> pending_;
        mutable std::size_t dropped_ = 0;
        bool delivering_ = false;
        bool stopping_ = false;
        std::thread worker_;

        void dispatch();
    };

} // namespace api

#endif // RANGE_PUBLISHER_HPP
