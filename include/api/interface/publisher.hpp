// File: api/interface/publisher.hpp

#ifndef PUBLISHER_HPP
#define PUBLISHER_HPP

#include "types/range_estimate.hpp"

namespace api {

    class Publisher {
    public:
        virtual ~Publisher() = default;

        virtual void publish(const types::RangeEstimate &estimate) const = 0;
    };

} // namespace api

#endif // PUBLISHER_HPP
