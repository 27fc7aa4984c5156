#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "parbook/config.hpp"
#include "parbook/event.hpp"
#include "parbook/id_allocator.hpp"
#include "parbook/matching_engine.hpp"
#include "parbook/order_store.hpp"
#include "parbook/stats_aggregator.hpp"
#include "parbook/trader_ledger.hpp"
#include "parbook/types.hpp"

namespace parbook {

/**
 * Conflict-free order book: the single entry point for callers.
 *
 * Design
 *  - ids_    : atomic id counter, handed to store_ explicitly.
 *  - store_  : id -> order record, lock-free, status moved by CAS.
 *  - ledger_ : per-trader order count and settled balance, sharded.
 *  - engine_ : exact-amount pair matcher over store_ and ledger_.
 *  - stats_  : book-wide placed/matched/cancelled counters.
 *
 * Every operation may be called from any number of threads at once.
 * Operations on different orders do not serialize against each other;
 * racing operations on the same order resolve so that exactly one wins.
 *
 * Rejected calls throw BookError and change nothing.
 */
class OrderBook
{
public:
    explicit OrderBook(const BookConfig& cfg = BookConfig{});

    OrderBook(const OrderBook&) = delete;
    OrderBook& operator=(const OrderBook&) = delete;

    /// Register an event listener. NOT thread-safe: subscribe before the
    /// book is shared between threads.
    void subscribe(EventCallback cb);

    /// Place a resting order and return its id (1, 2, ...).
    /// Throws BookError(InvalidAmount) if base_amount or quote_amount is 0.
    OrderId place_order(const TraderId& owner, const Amount& base_amount,
                        const Amount& quote_amount, Side side);

    /// Cancel an Active order.
    /// Throws BookError(OrderNotFound) for unknown, cancelled or matched ids
    /// and BookError(Unauthorized) if caller is not the owner.
    void cancel_order(const TraderId& caller, OrderId id);

    /// Try to match buy_ids[i] with sell_ids[i] for every i and return the
    /// number of pairs that matched. Pairs that do not match are skipped.
    /// Throws BookError(InvalidBatchSize) if the lists differ in length.
    std::size_t match_orders_batch(const std::vector<OrderId>& buy_ids,
                                   const std::vector<OrderId>& sell_ids);

    /// Record in any status; nullopt if the id was never issued.
    std::optional<Order> get_order(OrderId id) const;

    /// True iff id resolves to an Active order.
    bool order_exists(OrderId id) const;

    TraderStats get_trader_stats(const TraderId& trader) const;

    BookStats get_order_book_stats() const noexcept;

    /// Orders placed so far (same as get_order_book_stats().total_placed).
    std::uint64_t get_order_count() const noexcept;

    const BookConfig& config() const noexcept { return config_; }

private:
    void emit(const BookEvent& ev) const;

    BookConfig config_;

    IdAllocator     ids_;
    OrderStore      store_;
    TraderLedger    ledger_;
    MatchingEngine  engine_;
    StatsAggregator stats_;

    std::vector<EventCallback> listeners_;
};

} // namespace parbook
