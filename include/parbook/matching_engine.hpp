#pragma once

#include <optional>

#include "parbook/order_store.hpp"
#include "parbook/trader_ledger.hpp"
#include "parbook/types.hpp"

namespace parbook {

/**
 * Pairwise exact-amount matcher.
 *
 * A pair (buy_id, sell_id) matches iff both orders are Active, the order at
 * buy_id is a Buy, buy.base == sell.base and buy.quote >= sell.base.
 * The side of the order at sell_id is not checked.
 *
 * On a match the buyer is credited sell.base, the seller buy.quote, and both
 * orders become Matched. Any other outcome leaves everything untouched.
 *
 * Thread-safe. Both orders are reserved in ascending id order before the
 * commit, so matches on disjoint pairs never interact and overlapping
 * matches cannot deadlock.
 */
class MatchingEngine
{
public:
    MatchingEngine(OrderStore& store, TraderLedger& ledger);

    /// Engaged result means the pair matched.
    std::optional<Fill> try_match(OrderId buy_id, OrderId sell_id);

    /// The exact-match rule on its own, without any state check.
    static bool compatible(const Order& buy, const Order& sell);

private:
    OrderStore&   store_;
    TraderLedger& ledger_;
};

} // namespace parbook
