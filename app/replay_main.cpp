#include "parbook/command.hpp"
#include "parbook/config.hpp"
#include "parbook/errors.hpp"
#include "parbook/event.hpp"
#include "parbook/order_book.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace parbook;
using nlohmann::json;

// --------- stats struct ---------

struct ReplayStats {
    std::size_t lines        = 0;
    std::size_t malformed    = 0;

    std::size_t place_count  = 0;
    std::size_t cancel_count = 0;
    std::size_t match_count  = 0;   // MATCH commands (batches)

    std::size_t place_ok     = 0;
    std::size_t cancel_ok    = 0;
    std::size_t batches_ok   = 0;

    std::size_t pairs_submitted = 0;
    std::size_t pairs_matched   = 0;

    std::size_t err_invalid_amount     = 0;
    std::size_t err_order_not_found    = 0;
    std::size_t err_unauthorized       = 0;
    std::size_t err_invalid_batch_size = 0;
};

static void count_error(ReplayStats& st, ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidAmount:    ++st.err_invalid_amount;     break;
    case ErrorCode::OrderNotFound:    ++st.err_order_not_found;    break;
    case ErrorCode::Unauthorized:     ++st.err_unauthorized;       break;
    case ErrorCode::InvalidBatchSize: ++st.err_invalid_batch_size; break;
    }
}

static void apply(OrderBook& book, const Command& cmd, ReplayStats& st) {
    switch (cmd.type) {
    case CommandType::Place: {
        ++st.place_count;
        (void)book.place_order(cmd.trader, cmd.base_amount, cmd.quote_amount, cmd.side);
        ++st.place_ok;
        break;
    }
    case CommandType::Cancel: {
        ++st.cancel_count;
        book.cancel_order(cmd.trader, cmd.id);
        ++st.cancel_ok;
        break;
    }
    case CommandType::Match: {
        ++st.match_count;
        st.pairs_submitted += cmd.buy_ids.size();
        st.pairs_matched   += book.match_orders_batch(cmd.buy_ids, cmd.sell_ids);
        ++st.batches_ok;
        break;
    }
    }
}

static void print_stats(const ReplayStats& st, const OrderBook& book) {
    auto bs = book.get_order_book_stats();

    std::cout << "=== Replay summary ===\n\n";

    std::cout << "Lines:\n";
    std::cout << "  read      : " << st.lines     << "\n";
    std::cout << "  malformed : " << st.malformed << "\n\n";

    std::cout << "Commands (ok / total):\n";
    std::cout << "  PLACE  : " << st.place_ok   << " / " << st.place_count  << "\n";
    std::cout << "  CANCEL : " << st.cancel_ok  << " / " << st.cancel_count << "\n";
    std::cout << "  MATCH  : " << st.batches_ok << " / " << st.match_count  << "\n\n";

    std::cout << "Matching:\n";
    std::cout << "  pairs submitted: " << st.pairs_submitted << "\n";
    std::cout << "  pairs matched  : " << st.pairs_matched   << "\n\n";

    std::cout << "Rejections:\n";
    std::cout << "  InvalidAmount   : " << st.err_invalid_amount     << "\n";
    std::cout << "  OrderNotFound   : " << st.err_order_not_found    << "\n";
    std::cout << "  Unauthorized    : " << st.err_unauthorized       << "\n";
    std::cout << "  InvalidBatchSize: " << st.err_invalid_batch_size << "\n\n";

    std::cout << "Book stats:\n";
    std::cout << "  placed   : " << bs.total_placed    << "\n";
    std::cout << "  matched  : " << bs.total_matched   << "\n";
    std::cout << "  cancelled: " << bs.total_cancelled << "\n";
}

static json make_report(const ReplayStats& st, const OrderBook& book) {
    auto bs = book.get_order_book_stats();
    return json{
        {"config", to_json(book.config())},
        {"lines", st.lines},
        {"malformed", st.malformed},
        {"commands", {
            {"place",  {{"ok", st.place_ok},   {"total", st.place_count}}},
            {"cancel", {{"ok", st.cancel_ok},  {"total", st.cancel_count}}},
            {"match",  {{"ok", st.batches_ok}, {"total", st.match_count}}},
        }},
        {"pairs", {{"submitted", st.pairs_submitted}, {"matched", st.pairs_matched}}},
        {"rejections", {
            {"InvalidAmount", st.err_invalid_amount},
            {"OrderNotFound", st.err_order_not_found},
            {"Unauthorized", st.err_unauthorized},
            {"InvalidBatchSize", st.err_invalid_batch_size},
        }},
        {"book", {
            {"placed", bs.total_placed},
            {"matched", bs.total_matched},
            {"cancelled", bs.total_cancelled},
        }},
    };
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: parbook_replay <commands_file> [config.json] [report.json]\n";
        return 1;
    }

    const char* path = argv[1];
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Failed to open: " << path << "\n";
        return 1;
    }

    BookConfig cfg;
    if (argc > 2 && std::string(argv[2]) != "-") {
        try {
            cfg = load_config(argv[2]);
        } catch (const std::exception& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
    }

    OrderBook book(cfg);
    if (std::getenv("PARBOOK_VERBOSE")) {
        book.subscribe(make_event_printer(std::cout));
    }

    ReplayStats stats;

    std::string line;
    while (std::getline(in, line)) {
        ++stats.lines;

        auto parsed = parse_command(line);
        if (parsed.status == ParseStatus::Skip) {
            continue;
        }
        if (parsed.status == ParseStatus::Malformed) {
            ++stats.malformed;
            std::cerr << "Skipping line " << stats.lines << ": " << line << "\n";
            continue;
        }

        try {
            apply(book, parsed.cmd, stats);
        } catch (const BookError& e) {
            count_error(stats, e.code());
        } catch (const std::exception& e) {
            std::cerr << "line " << stats.lines << ": " << e.what() << "\n";
            return 1;
        }
    }

    print_stats(stats, book);

    if (argc > 3) {
        std::ofstream out(argv[3]);
        if (!out) {
            std::cerr << "Failed to write report: " << argv[3] << "\n";
            return 1;
        }
        out << make_report(stats, book).dump(2) << "\n";
        std::cout << "\nReport saved to: " << argv[3] << "\n";
    }

    return 0;
}
