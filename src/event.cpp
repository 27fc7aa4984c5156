#include "parbook/event.hpp"

#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>

namespace parbook {

const char* to_string(EventType type) noexcept
{
    switch (type)
    {
    case EventType::OrderPlaced:     return "OrderPlaced";
    case EventType::OrderCancelled:  return "OrderCancelled";
    case EventType::OrderMatched:    return "OrderMatched";
    case EventType::OrdersProcessed: return "OrdersProcessed";
    }
    return "Unknown";
}

namespace {

std::string format_event(const BookEvent& ev)
{
    std::ostringstream oss;
    oss << "[" << ev.ts_ns << "] " << to_string(ev.type);

    switch (ev.type)
    {
    case EventType::OrderPlaced:
        oss << " id=" << ev.order_id
            << " trader=" << ev.trader
            << " side=" << to_string(ev.side)
            << " base=" << ev.base_amount
            << " quote=" << ev.quote_amount;
        break;
    case EventType::OrderCancelled:
        oss << " id=" << ev.order_id
            << " trader=" << ev.trader
            << " reason=\"" << ev.reason << "\"";
        break;
    case EventType::OrderMatched:
        oss << " buy=" << ev.fill.buy_id
            << " sell=" << ev.fill.sell_id
            << " buyer=" << ev.fill.buyer
            << " (+" << ev.fill.buyer_credit << ")"
            << " seller=" << ev.fill.seller
            << " (+" << ev.fill.seller_credit << ")";
        break;
    case EventType::OrdersProcessed:
        oss << " pairs=" << ev.pairs_submitted
            << " matched=" << ev.pairs_matched;
        break;
    }
    return oss.str();
}

} // namespace

EventCallback make_event_printer(std::ostream& out)
{
    auto mu = std::make_shared<std::mutex>();
    return [&out, mu](const BookEvent& ev) {
        // format outside the lock, write under it
        std::string line = format_event(ev);
        std::lock_guard<std::mutex> lk(*mu);
        out << line << '\n';
    };
}

} // namespace parbook
