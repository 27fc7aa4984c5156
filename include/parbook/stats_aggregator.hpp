#pragma once

#include <cstdint>

#include "parbook/types.hpp"
#include "utils/cumulative_counter.hpp"

namespace parbook {

// Book-wide placed/matched/cancelled counters. Each counter is atomic on its
// own; a snapshot taken while writers run may mix moments.
class StatsAggregator
{
public:
    StatsAggregator() = default;

    void record_placed() { placed_.add(1); }
    void record_cancelled() { cancelled_.add(1); }
    void record_matched(std::uint64_t n)
    {
        if (n > 0)
            matched_.add(n);
    }

    BookStats snapshot() const noexcept
    {
        BookStats s;
        s.total_placed    = placed_.load();
        s.total_matched   = matched_.load();
        s.total_cancelled = cancelled_.load();
        return s;
    }

private:
    utils::CumulativeCounter<std::uint64_t> placed_;
    utils::CumulativeCounter<std::uint64_t> matched_;
    utils::CumulativeCounter<std::uint64_t> cancelled_;
};

} // namespace parbook
