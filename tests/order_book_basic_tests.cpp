#include <gtest/gtest.h>

#include "parbook/errors.hpp"
#include "parbook/event.hpp"
#include "parbook/order_book.hpp"
#include "parbook/types.hpp"

#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace parbook;

namespace {

ErrorCode error_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const BookError& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected BookError";
    return ErrorCode::InvalidAmount;
}

} // namespace

TEST(OrderBookBasic, IsEmptyOnInit) {
    OrderBook book;

    auto st = book.get_order_book_stats();
    EXPECT_EQ(st.total_placed, 0u);
    EXPECT_EQ(st.total_matched, 0u);
    EXPECT_EQ(st.total_cancelled, 0u);
    EXPECT_EQ(book.get_order_count(), 0u);

    EXPECT_FALSE(book.get_order(1).has_value());
    EXPECT_FALSE(book.order_exists(1));
    EXPECT_EQ(book.get_trader_stats("nobody").order_count, 0u);
}

// --- placement ---

TEST(OrderBookPlace, ReturnsSequentialIds) {
    OrderBook book;
    EXPECT_EQ(book.place_order("alice", 1000, 2000, Side::Buy), 1u);
    EXPECT_EQ(book.place_order("bob", 1000, 2000, Side::Sell), 2u);
    EXPECT_EQ(book.get_order_count(), 2u);
}

TEST(OrderBookPlace, StoresOrderAndUpdatesTrader) {
    OrderBook book;
    OrderId id = book.place_order("alice", 1000, 2000, Side::Buy);

    auto ord = book.get_order(id);
    ASSERT_TRUE(ord.has_value());
    EXPECT_EQ(ord->owner, "alice");
    EXPECT_EQ(ord->base_amount, 1000);
    EXPECT_EQ(ord->quote_amount, 2000);
    EXPECT_TRUE(ord->is_buy());
    EXPECT_TRUE(ord->is_active());
    EXPECT_TRUE(book.order_exists(id));

    auto ts = book.get_trader_stats("alice");
    EXPECT_EQ(ts.order_count, 1u);
    EXPECT_EQ(ts.settled_balance, 0);
}

TEST(OrderBookPlace, ZeroAmountsAreRejectedAndNotCounted) {
    OrderBook book;
    EXPECT_EQ(error_of([&] { book.place_order("alice", 0, 10, Side::Buy); }),
              ErrorCode::InvalidAmount);
    EXPECT_EQ(error_of([&] { book.place_order("alice", 10, 0, Side::Sell); }),
              ErrorCode::InvalidAmount);

    EXPECT_EQ(book.get_order_book_stats().total_placed, 0u);
    EXPECT_EQ(book.get_trader_stats("alice").order_count, 0u);

    // rejected calls consume no id
    EXPECT_EQ(book.place_order("alice", 10, 10, Side::Buy), 1u);
}

TEST(OrderBookPlace, KeepsAcceptingPastAMillionOrders) {
    OrderBook book;
    const OrderId n = (OrderId{1} << 20) + 10;

    OrderId last = kNoOrder;
    for (OrderId i = 0; i < n; ++i) {
        last = book.place_order("A", 1, 1, Side::Buy);
    }
    EXPECT_EQ(last, n);
    EXPECT_EQ(book.get_order_count(), n);
    EXPECT_TRUE(book.order_exists(n));
    EXPECT_EQ(book.get_order(1 << 20)->status, OrderStatus::Active);
}

// --- cancellation ---

TEST(OrderBookCancel, OwnerCancels) {
    OrderBook book;
    OrderId id = book.place_order("alice", 10, 20, Side::Sell);

    book.cancel_order("alice", id);

    EXPECT_FALSE(book.order_exists(id));
    auto ord = book.get_order(id);
    ASSERT_TRUE(ord.has_value());
    EXPECT_EQ(ord->status, OrderStatus::Cancelled);
    EXPECT_EQ(book.get_order_book_stats().total_cancelled, 1u);
}

TEST(OrderBookCancel, NonOwnerIsUnauthorizedAndOrderStaysActive) {
    OrderBook book;
    OrderId id = book.place_order("alice", 10, 20, Side::Sell);

    EXPECT_EQ(error_of([&] { book.cancel_order("mallory", id); }), ErrorCode::Unauthorized);
    EXPECT_TRUE(book.order_exists(id));
    EXPECT_EQ(book.get_order_book_stats().total_cancelled, 0u);
}

TEST(OrderBookCancel, UnknownIdIsNotFound) {
    OrderBook book;
    EXPECT_EQ(error_of([&] { book.cancel_order("alice", 7); }), ErrorCode::OrderNotFound);
    EXPECT_EQ(error_of([&] { book.cancel_order("alice", kNoOrder); }), ErrorCode::OrderNotFound);
}

TEST(OrderBookCancel, SecondCancelIsNotFound) {
    OrderBook book;
    OrderId id = book.place_order("alice", 10, 20, Side::Buy);
    book.cancel_order("alice", id);

    EXPECT_EQ(error_of([&] { book.cancel_order("alice", id); }), ErrorCode::OrderNotFound);
    // non-owner on an inactive order also sees OrderNotFound
    EXPECT_EQ(error_of([&] { book.cancel_order("bob", id); }), ErrorCode::OrderNotFound);
    EXPECT_EQ(book.get_order_book_stats().total_cancelled, 1u);
}

TEST(OrderBookCancel, MatchedOrderCannotBeCancelled) {
    OrderBook book;
    OrderId buy  = book.place_order("alice", 100, 200, Side::Buy);
    OrderId sell = book.place_order("bob", 100, 100, Side::Sell);
    ASSERT_EQ(book.match_orders_batch({buy}, {sell}), 1u);

    EXPECT_EQ(error_of([&] { book.cancel_order("alice", buy); }), ErrorCode::OrderNotFound);
    EXPECT_EQ(book.get_order(buy)->status, OrderStatus::Matched);
}

TEST(OrderBookCancel, CancelledOrderCannotBeMatched) {
    OrderBook book;
    OrderId buy  = book.place_order("alice", 100, 200, Side::Buy);
    OrderId sell = book.place_order("bob", 100, 100, Side::Sell);
    book.cancel_order("bob", sell);

    EXPECT_EQ(book.match_orders_batch({buy}, {sell}), 0u);
    EXPECT_TRUE(book.order_exists(buy));
    EXPECT_EQ(book.get_order(sell)->status, OrderStatus::Cancelled);
}

// --- batch matching ---

TEST(OrderBookMatch, EndToEndScenario) {
    OrderBook book;
    OrderId buy  = book.place_order("A", 100, 200, Side::Buy);
    OrderId sell = book.place_order("B", 100, 100, Side::Sell);

    EXPECT_EQ(book.match_orders_batch({buy}, {sell}), 1u);

    auto st = book.get_order_book_stats();
    EXPECT_EQ(st.total_placed, 2u);
    EXPECT_EQ(st.total_matched, 1u);
    EXPECT_EQ(st.total_cancelled, 0u);

    EXPECT_FALSE(book.order_exists(buy));
    EXPECT_FALSE(book.order_exists(sell));
    EXPECT_EQ(book.get_trader_stats("A").settled_balance, 100);
    EXPECT_EQ(book.get_trader_stats("B").settled_balance, 200);
}

TEST(OrderBookMatch, DifferentBaseLeavesBothActive) {
    OrderBook book;
    OrderId buy  = book.place_order("A", 100, 200, Side::Buy);
    OrderId sell = book.place_order("B", 50, 50, Side::Sell);

    EXPECT_EQ(book.match_orders_batch({buy}, {sell}), 0u);
    EXPECT_TRUE(book.order_exists(buy));
    EXPECT_TRUE(book.order_exists(sell));
    EXPECT_EQ(book.get_order_book_stats().total_matched, 0u);
}

TEST(OrderBookMatch, MismatchedLengthsAreRejected) {
    OrderBook book;
    OrderId buy  = book.place_order("A", 100, 200, Side::Buy);
    OrderId sell = book.place_order("B", 100, 100, Side::Sell);

    EXPECT_EQ(error_of([&] { book.match_orders_batch({buy}, {sell, sell}); }),
              ErrorCode::InvalidBatchSize);
    EXPECT_EQ(error_of([&] { book.match_orders_batch({buy}, {}); }),
              ErrorCode::InvalidBatchSize);

    // nothing happened
    EXPECT_TRUE(book.order_exists(buy));
    EXPECT_TRUE(book.order_exists(sell));
    EXPECT_EQ(book.get_order_book_stats().total_matched, 0u);
}

TEST(OrderBookMatch, EmptyBatchIsValid) {
    OrderBook book;
    EXPECT_EQ(book.match_orders_batch({}, {}), 0u);
}

TEST(OrderBookMatch, AllInvalidPairsReturnZero) {
    OrderBook book;
    OrderId buy  = book.place_order("A", 100, 200, Side::Buy);
    OrderId sell = book.place_order("B", 100, 100, Side::Sell);

    // reversed, unknown, self
    EXPECT_EQ(book.match_orders_batch({sell, 99, buy}, {buy, sell, buy}), 0u);
    EXPECT_TRUE(book.order_exists(buy));
    EXPECT_TRUE(book.order_exists(sell));
}

TEST(OrderBookMatch, PartialBatchCountsOnlyMatches) {
    OrderBook book;
    OrderId b1 = book.place_order("A", 100, 200, Side::Buy);
    OrderId s1 = book.place_order("B", 100, 100, Side::Sell);
    OrderId b2 = book.place_order("A", 30, 30, Side::Buy);
    OrderId s2 = book.place_order("B", 40, 40, Side::Sell);
    OrderId b3 = book.place_order("C", 5, 10, Side::Buy);
    OrderId s3 = book.place_order("D", 5, 1, Side::Sell);

    EXPECT_EQ(book.match_orders_batch({b1, b2, b3}, {s1, s2, s3}), 2u);
    EXPECT_EQ(book.get_order_book_stats().total_matched, 2u);
    EXPECT_TRUE(book.order_exists(b2));
    EXPECT_TRUE(book.order_exists(s2));
}

TEST(OrderBookMatch, SamePairTwiceInOneBatchMatchesOnce) {
    OrderBook book;
    OrderId buy  = book.place_order("A", 100, 200, Side::Buy);
    OrderId sell = book.place_order("B", 100, 100, Side::Sell);

    EXPECT_EQ(book.match_orders_batch({buy, buy}, {sell, sell}), 1u);
    EXPECT_EQ(book.get_trader_stats("A").settled_balance, 100);
}

// --- events ---

TEST(OrderBookEvents, EmitsOneEventPerSuccessfulChange) {
    OrderBook book;
    std::vector<BookEvent> events;
    book.subscribe([&](const BookEvent& ev) { events.push_back(ev); });

    OrderId buy  = book.place_order("A", 100, 200, Side::Buy);
    OrderId sell = book.place_order("B", 100, 100, Side::Sell);
    OrderId other = book.place_order("C", 1, 1, Side::Sell);
    book.cancel_order("C", other);
    EXPECT_THROW(book.cancel_order("C", other), BookError);
    EXPECT_THROW(book.place_order("C", 0, 1, Side::Sell), BookError);
    book.match_orders_batch({buy, other}, {sell, buy});

    ASSERT_EQ(events.size(), 6u);

    EXPECT_EQ(events[0].type, EventType::OrderPlaced);
    EXPECT_EQ(events[0].order_id, buy);
    EXPECT_EQ(events[0].trader, "A");
    EXPECT_EQ(events[0].side, Side::Buy);
    EXPECT_EQ(events[0].base_amount, 100);
    EXPECT_EQ(events[0].quote_amount, 200);

    EXPECT_EQ(events[3].type, EventType::OrderCancelled);
    EXPECT_EQ(events[3].order_id, other);
    EXPECT_FALSE(events[3].reason.empty());

    EXPECT_EQ(events[4].type, EventType::OrderMatched);
    EXPECT_EQ(events[4].fill.buy_id, buy);
    EXPECT_EQ(events[4].fill.sell_id, sell);
    EXPECT_EQ(events[4].fill.buyer_credit, 100);
    EXPECT_EQ(events[4].fill.seller_credit, 200);

    EXPECT_EQ(events[5].type, EventType::OrdersProcessed);
    EXPECT_EQ(events[5].pairs_submitted, 2u);
    EXPECT_EQ(events[5].pairs_matched, 1u);
    EXPECT_GT(events[5].ts_ns, 0);
}

TEST(OrderBookEvents, PrinterWritesOneLinePerEvent) {
    OrderBook book;
    std::ostringstream out;
    book.subscribe(make_event_printer(out));

    OrderId buy  = book.place_order("A", 100, 200, Side::Buy);
    OrderId sell = book.place_order("B", 100, 100, Side::Sell);
    book.match_orders_batch({buy}, {sell});

    const std::string text = out.str();
    EXPECT_NE(text.find("OrderPlaced id=1 trader=A side=BUY base=100 quote=200"), std::string::npos);
    EXPECT_NE(text.find("OrderMatched buy=1 sell=2"), std::string::npos);
    EXPECT_NE(text.find("OrdersProcessed pairs=1 matched=1"), std::string::npos);

    std::size_t lines = 0;
    for (char c : text) lines += (c == '\n');
    EXPECT_EQ(lines, 4u);
}

TEST(OrderBookEvents, ThrowingListenerDoesNotHideCommittedMatches) {
    OrderBook book;
    OrderId buy  = book.place_order("A", 100, 200, Side::Buy);
    OrderId sell = book.place_order("B", 100, 100, Side::Sell);
    OrderId buy2  = book.place_order("A", 5, 5, Side::Buy);
    OrderId sell2 = book.place_order("B", 5, 5, Side::Sell);

    book.subscribe([](const BookEvent& ev) {
        if (ev.type == EventType::OrderMatched)
            throw std::runtime_error("listener failed");
    });

    EXPECT_THROW(book.match_orders_batch({buy, buy2}, {sell, sell2}), std::runtime_error);

    // both pairs committed before any listener ran, and both are counted
    EXPECT_EQ(book.get_order(buy)->status, OrderStatus::Matched);
    EXPECT_EQ(book.get_order(sell2)->status, OrderStatus::Matched);
    EXPECT_EQ(book.get_order_book_stats().total_matched, 2u);
    EXPECT_EQ(book.get_trader_stats("A").settled_balance, 105);
    EXPECT_EQ(book.get_trader_stats("B").settled_balance, 205);
}
