// File: api/range_publisher.cpp

#include "api/range_publisher.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include "common/formatting/fmt_ranging.hpp"
#include "common/logging/logger.hpp"

namespace api {

    RangePublisher::RangePublisher(std::shared_ptr<RangeCallback> callback, const std::size_t capacity) :
        callback_(std::move(callback)), capacity_(std::max<std::size_t>(capacity, 1)) {
        if (!callback_) {
            throw std::invalid_argument("RangeCallback cannot be null");
        }
        worker_ = std::thread(&RangePublisher::dispatch, this);
    }

    RangePublisher::~RangePublisher() {
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
        }
        pending_cv_.notify_one();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void RangePublisher::publish(const types::RangeEstimate &estimate) const {
        {
            std::lock_guard lock(mutex_);
            if (pending_.size() >= capacity_) {
                pending_.pop_front();
                ++dropped_;
                LOG_WARN("Range consumer is behind, dropped a pending snapshot ({} dropped so far)", dropped_);
            }
            pending_.push_back(estimate);
        }
        pending_cv_.notify_one();
        LOG_DEBUG("Published range: {}", estimate);
    }

    void RangePublisher::flush() const {
        std::unique_lock lock(mutex_);
        idle_cv_.wait(lock, [this] { return pending_.empty() && !delivering_; });
    }

    std::size_t RangePublisher::dropped() const {
        std::lock_guard lock(mutex_);
        return dropped_;
    }

    void RangePublisher::dispatch() {
        std::unique_lock lock(mutex_);
        while (true) {
            pending_cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
            if (pending_.empty()) {
                break;
            }

            const types::RangeEstimate estimate = std::move(pending_.front());
            pending_.pop_front();
            delivering_ = true;
            lock.unlock();

            try {
                callback_->invoke(estimate);
            } catch (const std::exception &e) {
                LOG_ERROR("Range callback failed: {}", e.what());
            }

            lock.lock();
            delivering_ = false;
            if (pending_.empty()) {
                idle_cv_.notify_all();
            }
        }
        idle_cv_.notify_all();
    }

} // namespace api
