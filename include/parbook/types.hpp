#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <string>

namespace parbook {

using Amount   = boost::multiprecision::uint256_t;  // base/quote quantities, 256-bit
using OrderId  = std::uint64_t;                     // 0 is never issued
using TraderId = std::string;                       // opaque identity, compared by equality

constexpr OrderId kNoOrder = 0;

enum class Side : std::uint8_t {
    Buy,
    Sell
};

enum class OrderStatus : std::uint8_t {
    Active,
    Cancelled,
    Matched
};

// Snapshot of a stored order. Everything except status is fixed at creation.
struct Order {
    OrderId      id{kNoOrder};
    TraderId     owner;
    Amount       base_amount{0};
    Amount       quote_amount{0};
    Side         side{Side::Buy};
    OrderStatus  status{OrderStatus::Active};
    std::int64_t timestamp_ns{0};

    bool is_active() const noexcept { return status == OrderStatus::Active; }
    bool is_buy() const noexcept { return side == Side::Buy; }
};

struct TraderStats {
    std::uint64_t order_count{0};     // orders ever placed
    Amount        settled_balance{0}; // credits from matches, never decreases
};

struct BookStats {
    std::uint64_t total_placed{0};
    std::uint64_t total_matched{0};
    std::uint64_t total_cancelled{0};
};

// Result of one successful pairwise match.
struct Fill {
    OrderId  buy_id{kNoOrder};
    OrderId  sell_id{kNoOrder};
    TraderId buyer;
    TraderId seller;
    Amount   buyer_credit{0};   // sell.base_amount
    Amount   seller_credit{0};  // buy.quote_amount
};

const char* to_string(Side side) noexcept;
const char* to_string(OrderStatus status) noexcept;

std::int64_t now_ns() noexcept;

} // namespace parbook
