#include "parbook/matching_engine.hpp"

#include <algorithm> // std::min, std::max

namespace parbook {

MatchingEngine::MatchingEngine(OrderStore& store, TraderLedger& ledger)
    : store_(store), ledger_(ledger)
{
}

bool MatchingEngine::compatible(const Order& buy, const Order& sell)
{
    return buy.quote_amount >= sell.base_amount
        && buy.base_amount == sell.base_amount;
}

std::optional<Fill> MatchingEngine::try_match(OrderId buy_id, OrderId sell_id)
{
    // An order never matches itself.
    if (buy_id == sell_id)
        return std::nullopt;

    auto buy  = store_.get(buy_id);
    auto sell = store_.get(sell_id);
    if (!buy || !sell || !buy->is_active() || !sell->is_active())
        return std::nullopt;

    if (buy->side != Side::Buy)
        return std::nullopt;

    // Amounts are immutable, so this check holds for the whole call.
    if (!compatible(*buy, *sell))
        return std::nullopt;

    // Reserve in id order; a concurrent match on either id waits or loses.
    const OrderId first  = std::min(buy_id, sell_id);
    const OrderId second = std::max(buy_id, sell_id);

    if (!store_.try_reserve(first))
        return std::nullopt;

    if (!store_.try_reserve(second))
    {
        store_.release(first);
        return std::nullopt;
    }

    store_.invalidate(buy_id, OrderStatus::Matched);
    store_.invalidate(sell_id, OrderStatus::Matched);

    Fill fill;
    fill.buy_id        = buy_id;
    fill.sell_id       = sell_id;
    fill.buyer         = buy->owner;
    fill.seller        = sell->owner;
    fill.buyer_credit  = sell->base_amount;
    fill.seller_credit = buy->quote_amount;

    ledger_.credit(fill.buyer, fill.buyer_credit);
    ledger_.credit(fill.seller, fill.seller_credit);

    return fill;
}

} // namespace parbook
