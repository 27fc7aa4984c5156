#include "parbook/trader_ledger.hpp"

#include <functional>
#include <stdexcept>

namespace parbook {

TraderLedger::TraderLedger(std::size_t num_shards)
    : shards_(num_shards)
{
    if (num_shards == 0)
        throw std::invalid_argument("TraderLedger: num_shards must be > 0");
}

TraderLedger::Shard& TraderLedger::shard_for(const TraderId& trader) const
{
    return shards_[std::hash<TraderId>{}(trader) % shards_.size()];
}

void TraderLedger::record_order(const TraderId& trader)
{
    Shard& shard = shard_for(trader);
    std::lock_guard<std::mutex> lk(shard.mu);
    ++shard.stats[trader].order_count;
}

void TraderLedger::credit(const TraderId& trader, const Amount& amount)
{
    Shard& shard = shard_for(trader);
    std::lock_guard<std::mutex> lk(shard.mu);
    shard.stats[trader].settled_balance += amount;
}

TraderStats TraderLedger::get(const TraderId& trader) const
{
    Shard& shard = shard_for(trader);
    std::lock_guard<std::mutex> lk(shard.mu);
    auto it = shard.stats.find(trader);
    if (it == shard.stats.end())
        return TraderStats{};
    return it->second;
}

std::size_t TraderLedger::num_traders() const
{
    std::size_t n = 0;
    for (auto& shard : shards_)
    {
        std::lock_guard<std::mutex> lk(shard.mu);
        n += shard.stats.size();
    }
    return n;
}

} // namespace parbook
