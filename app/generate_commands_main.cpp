#include "parbook/command.hpp"
#include "parbook/types.hpp"

#include <cstdint>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

using namespace parbook;

struct Resting {
    TraderId      owner;
    Side          side;
    std::uint64_t base;
};

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: parbook_generate <num_commands> <seed> [num_traders]\n";
        return 1;
    }

    const std::size_t   num_commands = static_cast<std::size_t>(std::stoull(argv[1]));
    const std::uint32_t seed         = static_cast<std::uint32_t>(std::stoul(argv[2]));
    const std::size_t   num_traders  = (argc > 3) ? static_cast<std::size_t>(std::stoull(argv[3])) : 8;

    if (num_traders < 2) {
        std::cerr << "num_traders must be >= 2\n";
        return 1;
    }

    std::mt19937_64 rng(seed);

    // Command mix:
    // 0..69  -> PLACE  (70%)
    // 70..84 -> CANCEL (15%)
    // 85..99 -> MATCH  (15%)
    std::uniform_int_distribution<int> type_dist(0, 99);
    std::uniform_int_distribution<int> side_dist(0, 1);
    std::uniform_int_distribution<std::size_t> trader_dist(0, num_traders - 1);
    // few distinct base sizes, so equal-base pairs are common
    std::uniform_int_distribution<std::uint64_t> base_dist(1, 10);
    std::uniform_int_distribution<std::uint64_t> mult_dist(1, 20);
    std::uniform_int_distribution<int> pct_dist(0, 99);
    std::uniform_int_distribution<std::size_t> batch_dist(1, 16);

    std::vector<TraderId> traders;
    for (std::size_t i = 0; i < num_traders; ++i) {
        traders.push_back("trader-" + std::to_string(i));
    }

    // Ids are predicted: the book issues 1, 2, ... to accepted placements only.
    OrderId next_id = 1;

    std::unordered_map<OrderId, Resting> resting;
    std::vector<OrderId> active_ids;
    std::map<std::uint64_t, std::vector<OrderId>> buys_by_base;
    std::map<std::uint64_t, std::vector<OrderId>> sells_by_base;

    auto pop_live = [&](std::vector<OrderId>& ids) -> OrderId {
        while (!ids.empty()) {
            OrderId id = ids.back();
            ids.pop_back();
            if (resting.count(id)) return id;
        }
        return kNoOrder;
    };

    // Header comment (replay skips lines starting with '#')
    std::cout << "# PLACE,trader,side,base,quote | CANCEL,trader,id | MATCH,buy_ids,sell_ids\n";

    for (std::size_t i = 0; i < num_commands; ++i) {
        int r = type_dist(rng);

        // Nothing to cancel or match yet -> place.
        bool force_place = resting.empty();

        Command cmd;

        if (force_place || r < 70) {
            cmd.type   = CommandType::Place;
            cmd.trader = traders[trader_dist(rng)];
            cmd.side   = (side_dist(rng) == 0) ? Side::Buy : Side::Sell;

            std::uint64_t base = base_dist(rng) * 100;
            // buys offer at least base in quote so they can match
            std::uint64_t quote = (cmd.side == Side::Buy) ? base * mult_dist(rng)
                                                          : base_dist(rng) * 100;

            cmd.base_amount  = base;
            cmd.quote_amount = quote;

            // occasional zero amount -> InvalidAmount, consumes no id
            if (pct_dist(rng) < 2) {
                cmd.quote_amount = 0;
            } else {
                OrderId id = next_id++;
                resting[id] = Resting{cmd.trader, cmd.side, base};
                active_ids.push_back(id);
                if (cmd.side == Side::Buy) {
                    buys_by_base[base].push_back(id);
                } else {
                    sells_by_base[base].push_back(id);
                }
            }
        } else if (r < 85) {
            cmd.type = CommandType::Cancel;

            std::uniform_int_distribution<std::size_t> idx_dist(0, active_ids.size() - 1);
            std::size_t idx = idx_dist(rng);
            OrderId id = active_ids[idx];
            cmd.id = id;

            auto it = resting.find(id);
            if (it == resting.end()) {
                // already matched: OrderNotFound
                cmd.trader = traders[trader_dist(rng)];
                active_ids[idx] = active_ids.back();
                active_ids.pop_back();
            } else if (pct_dist(rng) < 20) {
                // somebody else's order: Unauthorized, stays active
                const TraderId& owner = it->second.owner;
                do {
                    cmd.trader = traders[trader_dist(rng)];
                } while (cmd.trader == owner);
            } else {
                cmd.trader = it->second.owner;
                resting.erase(it);
                active_ids[idx] = active_ids.back();
                active_ids.pop_back();
            }
        } else {
            cmd.type = CommandType::Match;

            std::size_t want = batch_dist(rng);
            for (auto& [base, buys] : buys_by_base) {
                auto& sells = sells_by_base[base];
                while (cmd.buy_ids.size() < want) {
                    OrderId b = pop_live(buys);
                    if (b == kNoOrder) break;
                    OrderId s = pop_live(sells);
                    if (s == kNoOrder) {
                        buys.push_back(b);
                        break;
                    }
                    cmd.buy_ids.push_back(b);
                    cmd.sell_ids.push_back(s);
                    resting.erase(b);
                    resting.erase(s);
                }
                if (cmd.buy_ids.size() >= want) break;
            }

            // a reversed pair never matches and must be skipped silently
            if (!cmd.buy_ids.empty() && pct_dist(rng) < 25) {
                cmd.buy_ids.push_back(cmd.sell_ids.front());
                cmd.sell_ids.push_back(cmd.buy_ids.front());
            }
        }

        std::cout << format_command(cmd) << "\n";
    }

    return 0;
}
