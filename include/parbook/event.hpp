#pragma once

#include "parbook/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

namespace parbook {

enum class EventType : std::uint8_t {
    OrderPlaced,
    OrderCancelled,
    OrderMatched,
    OrdersProcessed
};

// One notification raised by the book. Which fields are meaningful
// depends on type:
//   OrderPlaced     : order_id, trader, base/quote, side
//   OrderCancelled  : order_id, trader, reason
//   OrderMatched    : fill
//   OrdersProcessed : pairs_submitted, pairs_matched
struct BookEvent {
    EventType    type  = EventType::OrderPlaced;
    std::int64_t ts_ns = 0;

    OrderId  order_id = kNoOrder;
    TraderId trader;
    Amount   base_amount{0};
    Amount   quote_amount{0};
    Side     side = Side::Buy;

    std::string reason;

    Fill fill;

    std::size_t pairs_submitted = 0;
    std::size_t pairs_matched   = 0;
};

// Listeners run on the thread that performed the operation.
using EventCallback = std::function<void(const BookEvent&)>;

const char* to_string(EventType type) noexcept;

/// Renders each event as a single line on out. Safe to call from many threads.
EventCallback make_event_printer(std::ostream& out);

} // namespace parbook
