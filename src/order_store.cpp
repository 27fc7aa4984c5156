#include "parbook/order_store.hpp"
#include "parbook/errors.hpp"

#include <stdexcept>
#include <thread>

namespace parbook {

namespace {

// Returns the node in entry, installing a fresh one if it is still empty.
template <typename Node>
Node& install(std::atomic<Node*>& entry)
{
    Node* node = entry.load(std::memory_order_acquire);
    if (node)
        return *node;

    auto fresh = std::make_unique<Node>();
    if (entry.compare_exchange_strong(node, fresh.get(),
                                      std::memory_order_acq_rel,
                                      std::memory_order_acquire))
    {
        return *fresh.release();
    }
    // Another thread installed it first; node now points to theirs.
    return *node;
}

} // namespace

OrderStore::OrderStore(IdAllocator& ids)
    : ids_(ids)
{
    if (ids_.limit() > kMaxCapacity)
        throw std::invalid_argument("OrderStore: id limit above store capacity");

    // slot 0 stays empty, id N lives at index N
    num_directories_ = static_cast<std::size_t>(
        ids_.limit() >> (kSegmentBits + kDirectoryBits)) + 1;
    directories_ = std::make_unique<std::atomic<Directory*>[]>(num_directories_);
}

OrderStore::~OrderStore()
{
    for (std::size_t d = 0; d < num_directories_; ++d)
    {
        std::unique_ptr<Directory> dir(directories_[d].load(std::memory_order_relaxed));
        if (!dir)
            continue;

        for (auto& entry : dir->segments)
        {
            std::unique_ptr<Segment> seg(entry.load(std::memory_order_relaxed));
            if (!seg)
                continue;

            for (auto& slot : seg->slots)
                std::unique_ptr<Record> rec(slot.load(std::memory_order_relaxed));
        }
    }
}

OrderStore::State OrderStore::to_state(OrderStatus status) noexcept
{
    switch (status)
    {
    case OrderStatus::Active:    return State::Active;
    case OrderStatus::Cancelled: return State::Cancelled;
    case OrderStatus::Matched:   return State::Matched;
    }
    return State::Active;
}

OrderStatus OrderStore::to_status(State state) noexcept
{
    switch (state)
    {
    case State::Active:
    case State::Reserved:  return OrderStatus::Active;
    case State::Cancelled: return OrderStatus::Cancelled;
    case State::Matched:   return OrderStatus::Matched;
    }
    return OrderStatus::Active;
}

OrderStore::Segment& OrderStore::segment_for(OrderId id)
{
    Directory& dir = install(
        directories_[static_cast<std::size_t>(id >> (kSegmentBits + kDirectoryBits))]);
    return install(dir.segments[(id >> kSegmentBits) & kDirectoryMask]);
}

OrderStore::Record* OrderStore::find(OrderId id) const noexcept
{
    if (id == kNoOrder || id > ids_.limit())
        return nullptr;

    const Directory* dir =
        directories_[static_cast<std::size_t>(id >> (kSegmentBits + kDirectoryBits))]
            .load(std::memory_order_acquire);
    if (!dir)
        return nullptr;

    const Segment* seg =
        dir->segments[(id >> kSegmentBits) & kDirectoryMask].load(std::memory_order_acquire);
    if (!seg)
        return nullptr;

    return seg->slots[id & kSegmentMask].load(std::memory_order_acquire);
}

OrderId OrderStore::create(const TraderId& owner, const Amount& base_amount,
                           const Amount& quote_amount, Side side)
{
    if (base_amount == 0 || quote_amount == 0)
        throw BookError(ErrorCode::InvalidAmount, "base and quote amounts must be positive");

    const OrderId id = ids_.next();

    auto rec = std::make_unique<Record>(id, owner, base_amount, quote_amount, side, now_ns());
    Segment& seg = segment_for(id);
    seg.slots[id & kSegmentMask].store(rec.release(), std::memory_order_release);

    return id;
}

std::optional<Order> OrderStore::get(OrderId id) const
{
    const Record* rec = find(id);
    if (!rec)
        return std::nullopt;

    Order ord;
    ord.id           = rec->id;
    ord.owner        = rec->owner;
    ord.base_amount  = rec->base_amount;
    ord.quote_amount = rec->quote_amount;
    ord.side         = rec->side;
    ord.timestamp_ns = rec->timestamp_ns;
    ord.status       = to_status(rec->state.load(std::memory_order_acquire));
    return ord;
}

void OrderStore::invalidate(OrderId id, OrderStatus new_status)
{
    if (new_status == OrderStatus::Active)
        throw std::invalid_argument("OrderStore::invalidate: target status must not be Active");

    Record* rec = find(id);
    if (!rec)
        return;

    rec->state.store(to_state(new_status), std::memory_order_release);
}

bool OrderStore::transition_from_active(OrderId id, State target)
{
    Record* rec = find(id);
    if (!rec)
        return false;

    State cur = rec->state.load(std::memory_order_acquire);
    for (;;)
    {
        if (cur == State::Reserved)
        {
            // A match holds the order; it will commit or release shortly.
            std::this_thread::yield();
            cur = rec->state.load(std::memory_order_acquire);
            continue;
        }
        if (cur != State::Active)
            return false;

        if (rec->state.compare_exchange_weak(cur, target,
                                             std::memory_order_acq_rel,
                                             std::memory_order_acquire))
        {
            return true;
        }
    }
}

bool OrderStore::try_invalidate(OrderId id, OrderStatus new_status)
{
    if (new_status == OrderStatus::Active)
        throw std::invalid_argument("OrderStore::try_invalidate: target status must not be Active");

    return transition_from_active(id, to_state(new_status));
}

bool OrderStore::try_reserve(OrderId id)
{
    return transition_from_active(id, State::Reserved);
}

void OrderStore::release(OrderId id)
{
    Record* rec = find(id);
    if (!rec)
        return;

    rec->state.store(State::Active, std::memory_order_release);
}

std::size_t OrderStore::size() const noexcept
{
    return static_cast<std::size_t>(ids_.issued());
}

std::size_t OrderStore::capacity() const noexcept
{
    return static_cast<std::size_t>(ids_.limit());
}

} // namespace parbook
