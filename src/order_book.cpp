#include "parbook/order_book.hpp"
#include "parbook/errors.hpp"

#include <string>
#include <utility>
#include <vector>

namespace parbook {

OrderBook::OrderBook(const BookConfig& cfg)
    : config_(cfg),
      ids_(OrderStore::kMaxCapacity),
      store_(ids_),
      ledger_(cfg.trader_shards),
      engine_(store_, ledger_)
{
}

void OrderBook::subscribe(EventCallback cb)
{
    if (cb)
        listeners_.push_back(std::move(cb));
}

void OrderBook::emit(const BookEvent& ev) const
{
    for (const auto& cb : listeners_)
        cb(ev);
}

OrderId OrderBook::place_order(const TraderId& owner, const Amount& base_amount,
                               const Amount& quote_amount, Side side)
{
    if (base_amount == 0 || quote_amount == 0)
        throw BookError(ErrorCode::InvalidAmount, "base and quote amounts must be positive");

    const OrderId id = store_.create(owner, base_amount, quote_amount, side);
    ledger_.record_order(owner);
    stats_.record_placed();

    if (!listeners_.empty())
    {
        BookEvent ev;
        ev.type         = EventType::OrderPlaced;
        ev.ts_ns        = now_ns();
        ev.order_id     = id;
        ev.trader       = owner;
        ev.base_amount  = base_amount;
        ev.quote_amount = quote_amount;
        ev.side         = side;
        emit(ev);
    }

    return id;
}

void OrderBook::cancel_order(const TraderId& caller, OrderId id)
{
    auto ord = store_.get(id);
    if (!ord || !ord->is_active())
        throw BookError(ErrorCode::OrderNotFound,
                        "order " + std::to_string(id) + " not found or not active");

    if (caller != ord->owner)
        throw BookError(ErrorCode::Unauthorized,
                        "order " + std::to_string(id) + " is not owned by " + caller);

    // Lost a race with another cancel or a match.
    if (!store_.try_invalidate(id, OrderStatus::Cancelled))
        throw BookError(ErrorCode::OrderNotFound,
                        "order " + std::to_string(id) + " not found or not active");

    stats_.record_cancelled();

    if (!listeners_.empty())
    {
        BookEvent ev;
        ev.type     = EventType::OrderCancelled;
        ev.ts_ns    = now_ns();
        ev.order_id = id;
        ev.trader   = caller;
        ev.reason   = "cancelled by owner";
        emit(ev);
    }
}

std::size_t OrderBook::match_orders_batch(const std::vector<OrderId>& buy_ids,
                                          const std::vector<OrderId>& sell_ids)
{
    if (buy_ids.size() != sell_ids.size())
        throw BookError(ErrorCode::InvalidBatchSize,
                        "buy and sell id lists differ in length ("
                            + std::to_string(buy_ids.size()) + " vs "
                            + std::to_string(sell_ids.size()) + ")");

    std::vector<Fill> fills;
    for (std::size_t i = 0; i < buy_ids.size(); ++i)
    {
        auto fill = engine_.try_match(buy_ids[i], sell_ids[i]);
        if (fill)
            fills.push_back(std::move(*fill));
    }

    // Count before notifying: a throwing listener must not hide committed matches.
    const std::size_t matched = fills.size();
    stats_.record_matched(matched);

    if (!listeners_.empty())
    {
        for (auto& fill : fills)
        {
            BookEvent ev;
            ev.type  = EventType::OrderMatched;
            ev.ts_ns = now_ns();
            ev.fill  = std::move(fill);
            emit(ev);
        }

        BookEvent done;
        done.type            = EventType::OrdersProcessed;
        done.ts_ns           = now_ns();
        done.pairs_submitted = buy_ids.size();
        done.pairs_matched   = matched;
        emit(done);
    }

    return matched;
}

std::optional<Order> OrderBook::get_order(OrderId id) const
{
    return store_.get(id);
}

bool OrderBook::order_exists(OrderId id) const
{
    auto ord = store_.get(id);
    return ord && ord->is_active();
}

TraderStats OrderBook::get_trader_stats(const TraderId& trader) const
{
    return ledger_.get(trader);
}

BookStats OrderBook::get_order_book_stats() const noexcept
{
    return stats_.snapshot();
}

std::uint64_t OrderBook::get_order_count() const noexcept
{
    return stats_.snapshot().total_placed;
}

} // namespace parbook
