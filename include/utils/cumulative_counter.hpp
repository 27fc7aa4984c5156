#pragma once

#include <atomic>
#include <limits>
#include <optional>
#include <stdexcept>

namespace utils {

// Bounded counter that many threads can bump at once.
// Every successful add returns a distinct post-add value; an add that would
// leave [min, max] fails and leaves the counter untouched.
// T is an unsigned integer type; deltas are non-negative.
template <typename T>
class CumulativeCounter {
public:
    explicit CumulativeCounter(T initial = 0,
                               T min = std::numeric_limits<T>::min(),
                               T max = std::numeric_limits<T>::max())
        : min_(min),
          max_(max),
          value_(initial)
    {}

    CumulativeCounter(const CumulativeCounter&) = delete;
    CumulativeCounter& operator=(const CumulativeCounter&) = delete;

    // Returns the value after the add, or nullopt if the bound would be crossed.
    std::optional<T> try_add(T delta) noexcept {
        T current = value_.load(std::memory_order_relaxed);
        for (;;) {
            if (current > max_ || delta > max_ - current) {
                return std::nullopt;
            }
            const T next = current + delta;
            if (next < min_) {
                return std::nullopt;
            }
            // on failure current is reloaded
            if (value_.compare_exchange_weak(current, next,
                                             std::memory_order_acq_rel,
                                             std::memory_order_relaxed)) {
                return next;
            }
        }
    }

    T add(T delta) {
        auto res = try_add(delta);
        if (!res) {
            throw std::overflow_error("CumulativeCounter bound exceeded");
        }
        return *res;
    }

    T load() const noexcept {
        return value_.load(std::memory_order_acquire);
    }

    T min() const noexcept { return min_; }
    T max() const noexcept { return max_; }

private:
    const T        min_;
    const T        max_;
    std::atomic<T> value_;
};

} // namespace utils
