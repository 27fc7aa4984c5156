#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "parbook/id_allocator.hpp"
#include "parbook/types.hpp"

namespace parbook {

/**
 * Authoritative id -> order record table.
 *
 * Layout
 *  - Ids are dense (1, 2, 3, ...), so records live in fixed-size segments
 *    indexed directly by id through a two-level table:
 *      directory = id >> (kSegmentBits + kDirectoryBits)
 *      segment   = (id >> kSegmentBits) & kDirectoryMask
 *      slot      = id & kSegmentMask
 *  - Directories and segments are installed lazily with a CAS, so memory
 *    grows with the number of orders and not with capacity().
 *  - Slots hold atomic pointers that are published with release and read
 *    with acquire, so a reader never sees a half-built record.
 *  - Everything in a record is write-once except its state, which only
 *    moves through atomic compare-and-transition.
 *
 * All methods are thread-safe. No lock is taken on any path; the only
 * waiting is a yield loop while another thread holds a match reservation
 * on the same order.
 */
class OrderStore
{
public:
    static constexpr std::size_t kSegmentBits = 12;
    static constexpr std::size_t kSegmentSize = std::size_t{1} << kSegmentBits;
    static constexpr std::size_t kSegmentMask = kSegmentSize - 1;

    static constexpr std::size_t kDirectoryBits = 14;
    static constexpr std::size_t kDirectorySize = std::size_t{1} << kDirectoryBits;
    static constexpr std::size_t kDirectoryMask = kDirectorySize - 1;

    /// Largest id space a store can address (about 10^12 orders).
    static constexpr OrderId kMaxCapacity = OrderId{1} << 40;

    /// The store holds up to ids.limit() orders. Throws std::invalid_argument
    /// if that limit is above kMaxCapacity.
    explicit OrderStore(IdAllocator& ids);
    ~OrderStore();

    OrderStore(const OrderStore&) = delete;
    OrderStore& operator=(const OrderStore&) = delete;

    /// Store a new Active order and return its id.
    /// Throws BookError(InvalidAmount) if an amount is zero; no id is used then.
    OrderId create(const TraderId& owner, const Amount& base_amount,
                   const Amount& quote_amount, Side side);

    /// Snapshot of the record in any status, nullopt if the id was never issued.
    std::optional<Order> get(OrderId id) const;

    /// Unconditionally move a record out of Active. The caller has already
    /// checked that it is Active (or reserved by the caller) and authorized.
    void invalidate(OrderId id, OrderStatus new_status);

    /// Atomic Active -> new_status. False if the id is unknown or the order
    /// is no longer Active.
    bool try_invalidate(OrderId id, OrderStatus new_status);

    /// Atomic Active -> reserved, for a match in flight. While reserved the
    /// order still reads as Active and competing transitions wait.
    bool try_reserve(OrderId id);

    /// Give back a reservation the caller holds: reserved -> Active.
    void release(OrderId id);

    /// Number of ids issued so far.
    std::size_t size() const noexcept;

    std::size_t capacity() const noexcept;

private:
    enum class State : std::uint8_t {
        Active,
        Reserved,
        Cancelled,
        Matched
    };

    struct Record
    {
        Record(OrderId id_, const TraderId& owner_, const Amount& base_,
               const Amount& quote_, Side side_, std::int64_t ts_)
            : id(id_), owner(owner_), base_amount(base_), quote_amount(quote_),
              side(side_), timestamp_ns(ts_)
        {}

        const OrderId      id;
        const TraderId     owner;
        const Amount       base_amount;
        const Amount       quote_amount;
        const Side         side;
        const std::int64_t timestamp_ns;

        std::atomic<State> state{State::Active};
    };

    struct Segment
    {
        std::atomic<Record*> slots[kSegmentSize]{};
    };

    struct Directory
    {
        std::atomic<Segment*> segments[kDirectorySize]{};
    };

    static State to_state(OrderStatus status) noexcept;
    static OrderStatus to_status(State state) noexcept;

    Record*  find(OrderId id) const noexcept;
    Segment& segment_for(OrderId id);

    /// CAS Active -> target, yielding while the order is reserved.
    bool transition_from_active(OrderId id, State target);

    IdAllocator& ids_;
    std::size_t  num_directories_;
    std::unique_ptr<std::atomic<Directory*>[]> directories_;
};

} // namespace parbook
