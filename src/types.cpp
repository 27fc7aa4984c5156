#include "parbook/types.hpp"
#include "parbook/errors.hpp"

#include <chrono>

namespace parbook {

const char* to_string(Side side) noexcept
{
    return side == Side::Buy ? "BUY" : "SELL";
}

const char* to_string(OrderStatus status) noexcept
{
    switch (status)
    {
    case OrderStatus::Active:    return "ACTIVE";
    case OrderStatus::Cancelled: return "CANCELLED";
    case OrderStatus::Matched:   return "MATCHED";
    }
    return "UNKNOWN";
}

const char* to_string(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::InvalidAmount:    return "InvalidAmount";
    case ErrorCode::OrderNotFound:    return "OrderNotFound";
    case ErrorCode::Unauthorized:     return "Unauthorized";
    case ErrorCode::InvalidBatchSize: return "InvalidBatchSize";
    }
    return "Unknown";
}

std::int64_t now_ns() noexcept
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace parbook
