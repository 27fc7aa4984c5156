#include "parbook/errors.hpp"
#include "parbook/order_book.hpp"
#include "parbook/types.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <random>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace parbook;
using nlohmann::json;

using Clock       = std::chrono::steady_clock;
using Nanoseconds = std::chrono::nanoseconds;

struct PhaseResult {
    std::string name;
    std::size_t ops       = 0;
    std::size_t succeeded = 0;
    long long   ns        = 0;

    double seconds() const { return static_cast<double>(ns) / 1e9; }
    double ops_per_sec() const {
        return ns > 0 ? static_cast<double>(ops) / seconds() : 0.0;
    }
};

static void print_phase(const PhaseResult& p) {
    std::cout << p.name << ": " << p.succeeded << "/" << p.ops
              << " ok in " << p.seconds() << " s";
    if (p.ns > 0) {
        std::cout << ", " << p.ops_per_sec() << " ops/s";
    }
    std::cout << "\n";
}

static json to_json(const PhaseResult& p) {
    return json{
        {"name", p.name},
        {"ops", p.ops},
        {"succeeded", p.succeeded},
        {"seconds", p.seconds()},
        {"ops_per_sec", p.ops_per_sec()},
    };
}

// Runs fn(thread_index) on num_threads threads released at the same moment.
template <typename F>
static long long run_parallel(std::size_t num_threads, F&& fn) {
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    for (std::size_t t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            while (!go.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            fn(t);
        });
    }

    auto t0 = Clock::now();
    go.store(true, std::memory_order_release);
    for (auto& th : threads) {
        th.join();
    }
    auto t1 = Clock::now();
    return std::chrono::duration_cast<Nanoseconds>(t1 - t0).count();
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: parbook_mt_bench <orders_per_thread> <threads> [report.json]\n";
        return 1;
    }

    const std::size_t per_thread  = static_cast<std::size_t>(std::stoull(argv[1]));
    const std::size_t num_threads = static_cast<std::size_t>(std::stoull(argv[2]));

    if (per_thread == 0 || num_threads == 0) {
        std::cerr << "orders_per_thread and threads must be > 0\n";
        return 1;
    }

    OrderBook book;

    std::cout << "Config:\n"
              << "  threads           = " << num_threads << "\n"
              << "  orders_per_thread = " << per_thread << "\n"
              << "  trader_shards     = " << book.config().trader_shards << "\n\n";

    // ============ Phase 1: concurrent placement ============
    // Each thread is one trader and alternates Buy/Sell with equal base
    // amounts, so order 2k and 2k+1 of a thread form a matchable pair.
    std::vector<std::vector<OrderId>> placed(num_threads);
    std::atomic<std::size_t> place_ok{0};

    PhaseResult p1;
    p1.name = "place";
    p1.ops  = per_thread * num_threads;
    p1.ns   = run_parallel(num_threads, [&](std::size_t t) {
        std::mt19937_64 rng(1000 + t);
        std::uniform_int_distribution<std::uint64_t> base_dist(1, 1000);
        std::uniform_int_distribution<std::uint64_t> mult_dist(1, 20);

        const TraderId trader = "trader-" + std::to_string(t);
        auto& ids = placed[t];
        ids.reserve(per_thread);

        Amount base = 0;
        for (std::size_t i = 0; i < per_thread; ++i) {
            Side side = (i % 2 == 0) ? Side::Buy : Side::Sell;
            if (side == Side::Buy) {
                base = base_dist(rng) * 100;
            }
            Amount quote = base * mult_dist(rng);
            ids.push_back(book.place_order(trader, base, quote, side));
            place_ok.fetch_add(1, std::memory_order_relaxed);
        }
    });
    p1.succeeded = place_ok.load();
    print_phase(p1);

    // ============ Phase 2: concurrent batch matching ============
    // Thread t matches pairs of thread t, so batches never share an id.
    constexpr std::size_t BATCH = 64;
    std::atomic<std::size_t> pairs_matched{0};
    std::atomic<std::size_t> batches{0};

    PhaseResult p2;
    p2.name = "match";
    p2.ns   = run_parallel(num_threads, [&](std::size_t t) {
        const auto& ids = placed[t];
        std::vector<OrderId> buys, sells;
        // only every other pair is matched, the rest is left for phase 3
        for (std::size_t i = 0; i + 1 < ids.size(); i += 4) {
            buys.push_back(ids[i]);
            sells.push_back(ids[i + 1]);
            if (buys.size() == BATCH) {
                pairs_matched.fetch_add(book.match_orders_batch(buys, sells), std::memory_order_relaxed);
                batches.fetch_add(1, std::memory_order_relaxed);
                buys.clear();
                sells.clear();
            }
        }
        if (!buys.empty()) {
            pairs_matched.fetch_add(book.match_orders_batch(buys, sells), std::memory_order_relaxed);
            batches.fetch_add(1, std::memory_order_relaxed);
        }
    });
    for (std::size_t t = 0; t < num_threads; ++t) {
        p2.ops += (placed[t].size() + 2) / 4;
    }
    p2.succeeded = pairs_matched.load();
    print_phase(p2);

    // ============ Phase 3: racing cancels ============
    // Two threads fight over every remaining order; exactly one may win.
    std::atomic<std::size_t> cancel_ok{0};
    std::atomic<std::size_t> cancel_lost{0};

    std::vector<std::pair<TraderId, OrderId>> to_cancel;
    for (std::size_t t = 0; t < num_threads; ++t) {
        for (OrderId id : placed[t]) {
            if (book.order_exists(id)) {
                to_cancel.emplace_back("trader-" + std::to_string(t), id);
            }
        }
    }

    PhaseResult p3;
    p3.name = "cancel";
    p3.ops  = to_cancel.size() * 2;
    const std::size_t cancel_threads = 2 * std::max<std::size_t>(1, num_threads / 2);
    p3.ns   = run_parallel(cancel_threads, [&](std::size_t t) {
        // thread pairs (0,1), (2,3), ... cover the same slice
        const std::size_t pair_idx  = t / 2;
        const std::size_t num_pairs = cancel_threads / 2;
        for (std::size_t i = pair_idx; i < to_cancel.size(); i += num_pairs) {
            try {
                book.cancel_order(to_cancel[i].first, to_cancel[i].second);
                cancel_ok.fetch_add(1, std::memory_order_relaxed);
            } catch (const BookError& e) {
                if (e.code() == ErrorCode::OrderNotFound) {
                    cancel_lost.fetch_add(1, std::memory_order_relaxed);
                } else {
                    std::cerr << "unexpected cancel error: " << e.what() << "\n";
                }
            }
        }
    });
    p3.succeeded = cancel_ok.load();
    print_phase(p3);

    // ============ Verification ============
    bool ok = true;

    std::unordered_set<OrderId> seen;
    for (const auto& ids : placed) {
        for (OrderId id : ids) {
            if (!seen.insert(id).second) {
                std::cerr << "duplicate order id " << id << "\n";
                ok = false;
            }
        }
    }

    auto stats = book.get_order_book_stats();
    if (stats.total_placed != p1.succeeded) {
        std::cerr << "placed counter " << stats.total_placed << " != " << p1.succeeded << "\n";
        ok = false;
    }
    if (stats.total_matched != p2.succeeded) {
        std::cerr << "matched counter " << stats.total_matched << " != " << p2.succeeded << "\n";
        ok = false;
    }
    if (stats.total_cancelled != p3.succeeded || p3.succeeded != to_cancel.size()) {
        std::cerr << "cancelled counter " << stats.total_cancelled
                  << ", successful cancels " << p3.succeeded
                  << ", cancellable " << to_cancel.size() << "\n";
        ok = false;
    }

    std::cout << "\nBook stats: placed=" << stats.total_placed
              << ", matched=" << stats.total_matched
              << ", cancelled=" << stats.total_cancelled << "\n";
    std::cout << "Verification: " << (ok ? "OK" : "FAILED") << "\n";

    if (argc > 3) {
        json report{
            {"config", {{"threads", num_threads}, {"orders_per_thread", per_thread}}},
            {"phases", json::array({to_json(p1), to_json(p2), to_json(p3)})},
            {"batches", batches.load()},
            {"cancel_races_lost", cancel_lost.load()},
            {"book", {
                {"placed", stats.total_placed},
                {"matched", stats.total_matched},
                {"cancelled", stats.total_cancelled},
            }},
            {"verified", ok},
        };
        std::ofstream out(argv[3]);
        if (!out) {
            std::cerr << "Failed to write report: " << argv[3] << "\n";
            return 1;
        }
        out << report.dump(2) << "\n";
        std::cout << "Report saved to: " << argv[3] << "\n";
    }

    return ok ? 0 : 2;
}
