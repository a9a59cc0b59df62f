// File: api/range_callback.hpp

#ifndef RANGE_CALLBACK_HPP
#define RANGE_CALLBACK_HPP

#include <functional>
#include <mutex>
#include <vector>

#include "api/interface/callback.hpp"
#include "common/formatting/fmt_ranging.hpp"
#include "common/logging/logger.hpp"
#include "types/range_estimate.hpp"

namespace api {

    // Callbacks run on the publisher's dispatch thread and receive an immutable snapshot.
    class RangeCallback : public Callback {
    public:
        void registerCallback(CallbackFunction callback) override {
            std::lock_guard lock(mutex_);
            callbacks_.push_back(std::move(callback));
            LOG_INFO("New range callback registered. Total callbacks: {}", callbacks_.size());
        }

        void invoke(const types::RangeEstimate &estimate) const override {
            std::vector<CallbackFunction> callbacks;
            {
                std::lock_guard lock(mutex_);
                callbacks = callbacks_;
            }
            for (const auto &callback: callbacks) {
                callback(estimate);
            }
            LOG_TRACE("Range callback invoked for {}", estimate);
        }

        [[nodiscard]] std::size_t size() const {
            std::lock_guard lock(mutex_);
            return callbacks_.size();
        }

    private:
        mutable std::mutex mutex_;
        std::vector<CallbackFunction> callbacks_;
    };

} // namespace api

#endif // RANGE_CALLBACK_HPP
