// File: api/interface/callback.hpp

#ifndef CALLBACK_HPP
#define CALLBACK_HPP

#include <functional>

#include "types/range_estimate.hpp"

namespace api {

    class Callback {
    public:
        using CallbackFunction = std::function<void(const types::RangeEstimate &)>;
        virtual ~Callback() = default;

        virtual void registerCallback(CallbackFunction callback) = 0;
        virtual void invoke(const types::RangeEstimate &estimate) const = 0;
    };

} // namespace api

#endif // CALLBACK_HPP
