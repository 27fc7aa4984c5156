#pragma once

#include "parbook/types.hpp"
#include "utils/cumulative_counter.hpp"

#include <stdexcept>

namespace parbook {

/**
 * Hands out order ids 1, 2, 3, ... to any number of concurrent callers.
 * No two calls ever return the same id. Ids above `limit` are never issued:
 * such a request throws std::length_error and consumes nothing.
 */
class IdAllocator
{
public:
    explicit IdAllocator(OrderId limit)
        : counter_(0, 0, limit)
    {}

    OrderId next()
    {
        auto id = counter_.try_add(1);
        if (!id)
            throw std::length_error("order id space exhausted");
        return *id;
    }

    /// Number of ids handed out so far (also the highest issued id).
    OrderId issued() const noexcept { return counter_.load(); }

    OrderId limit() const noexcept { return counter_.max(); }

private:
    utils::CumulativeCounter<OrderId> counter_;
};

} // namespace parbook
