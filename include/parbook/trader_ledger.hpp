#pragma once

#include <cstddef>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "parbook/types.hpp"

namespace parbook {

/**
 * Per-trader bookkeeping (order count, settled balance).
 *
 * Traders are spread over independent shards by hash; each shard has its
 * own mutex, so updates for different traders rarely touch the same lock.
 */
class TraderLedger
{
public:
    explicit TraderLedger(std::size_t num_shards = 64);

    TraderLedger(const TraderLedger&) = delete;
    TraderLedger& operator=(const TraderLedger&) = delete;

    void record_order(const TraderId& trader);

    void credit(const TraderId& trader, const Amount& amount);

    /// Zero stats for traders never seen.
    TraderStats get(const TraderId& trader) const;

    std::size_t num_traders() const;

private:
    struct Shard
    {
        mutable std::mutex                        mu;
        std::unordered_map<TraderId, TraderStats> stats;
    };

    Shard& shard_for(const TraderId& trader) const;

    mutable std::vector<Shard> shards_;
};

} // namespace parbook
