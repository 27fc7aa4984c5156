#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "parbook/types.hpp"

namespace parbook {

enum class CommandType : std::uint8_t {
    Place,
    Cancel,
    Match
};

// One line of a command file:
//   PLACE,<trader>,<BUY|SELL>,<base>,<quote>
//   CANCEL,<trader>,<order_id>
//   MATCH,<buy_id;buy_id;...>,<sell_id;sell_id;...>
struct Command {
    CommandType type   = CommandType::Place;
    TraderId    trader;                  // Place, Cancel
    Side        side   = Side::Buy;      // Place
    Amount      base_amount{0};          // Place
    Amount      quote_amount{0};         // Place
    OrderId     id     = kNoOrder;       // Cancel
    std::vector<OrderId> buy_ids;        // Match
    std::vector<OrderId> sell_ids;       // Match
};

enum class ParseStatus : std::uint8_t {
    Ok,
    Skip,      // empty line or '#' comment
    Malformed
};

struct ParseResult {
    ParseStatus status = ParseStatus::Skip;
    Command     cmd;
};

ParseResult parse_command(const std::string& line);

std::optional<Side> parse_side(const std::string& token);

/// Decimal string to a 256-bit amount; nullopt on junk or overflow.
std::optional<Amount> parse_amount(const std::string& token);

/// Render a command back into its line form (no trailing newline).
std::string format_command(const Command& cmd);

} // namespace parbook
