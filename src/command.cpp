#include "parbook/command.hpp"

#include <cctype>
#include <limits>
#include <sstream>

namespace parbook {

namespace {

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string to_upper(std::string s)
{
    for (auto& c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

// Unlike getline-splitting, keeps empty trailing fields ("a,," -> a,"","").
std::vector<std::string> split(const std::string& s, char sep)
{
    std::vector<std::string> out;
    std::string::size_type start = 0;
    for (;;)
    {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos)
        {
            out.push_back(trim(s.substr(start)));
            return out;
        }
        out.push_back(trim(s.substr(start, pos - start)));
        start = pos + 1;
    }
}

std::optional<OrderId> parse_id(const std::string& token)
{
    if (token.empty() || token.size() > 20)
        return std::nullopt;
    for (char c : token)
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
    try {
        return static_cast<OrderId>(std::stoull(token));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<std::vector<OrderId>> parse_id_list(const std::string& token)
{
    std::vector<OrderId> ids;
    if (token.empty())
        return ids;

    for (const auto& part : split(token, ';'))
    {
        auto id = parse_id(part);
        if (!id)
            return std::nullopt;
        ids.push_back(*id);
    }
    return ids;
}

std::string join_ids(const std::vector<OrderId>& ids)
{
    std::ostringstream oss;
    for (std::size_t i = 0; i < ids.size(); ++i)
    {
        if (i) oss << ';';
        oss << ids[i];
    }
    return oss.str();
}

ParseResult malformed()
{
    ParseResult r;
    r.status = ParseStatus::Malformed;
    return r;
}

} // namespace

std::optional<Side> parse_side(const std::string& token)
{
    auto up = to_upper(trim(token));
    if (up == "BUY" || up == "B")  return Side::Buy;
    if (up == "SELL" || up == "S") return Side::Sell;
    return std::nullopt;
}

std::optional<Amount> parse_amount(const std::string& token)
{
    if (token.empty())
        return std::nullopt;

    const Amount max = std::numeric_limits<Amount>::max();
    Amount value = 0;
    for (char c : token)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
        const unsigned digit = static_cast<unsigned>(c - '0');
        if (value > (max - digit) / 10)
            return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

ParseResult parse_command(const std::string& line)
{
    ParseResult res;

    auto t = trim(line);
    if (t.empty() || t[0] == '#')
        return res;  // Skip

    auto fields = split(t, ',');
    auto type   = to_upper(fields[0]);

    Command& cmd = res.cmd;

    if (type == "PLACE" || type == "ADD")
    {
        // PLACE,trader,side,base,quote
        if (fields.size() != 5 || fields[1].empty())
            return malformed();

        auto side  = parse_side(fields[2]);
        auto base  = parse_amount(fields[3]);
        auto quote = parse_amount(fields[4]);
        if (!side || !base || !quote)
            return malformed();

        cmd.type         = CommandType::Place;
        cmd.trader       = fields[1];
        cmd.side         = *side;
        cmd.base_amount  = *base;
        cmd.quote_amount = *quote;
    }
    else if (type == "CANCEL" || type == "CXL")
    {
        // CANCEL,trader,id
        if (fields.size() != 3 || fields[1].empty())
            return malformed();

        auto id = parse_id(fields[2]);
        if (!id)
            return malformed();

        cmd.type   = CommandType::Cancel;
        cmd.trader = fields[1];
        cmd.id     = *id;
    }
    else if (type == "MATCH")
    {
        // MATCH,buy_ids,sell_ids
        if (fields.size() != 3)
            return malformed();

        auto buys  = parse_id_list(fields[1]);
        auto sells = parse_id_list(fields[2]);
        if (!buys || !sells)
            return malformed();

        cmd.type     = CommandType::Match;
        cmd.buy_ids  = std::move(*buys);
        cmd.sell_ids = std::move(*sells);
    }
    else
    {
        return malformed();
    }

    res.status = ParseStatus::Ok;
    return res;
}

std::string format_command(const Command& cmd)
{
    std::ostringstream oss;
    switch (cmd.type)
    {
    case CommandType::Place:
        oss << "PLACE," << cmd.trader << ',' << to_string(cmd.side) << ','
            << cmd.base_amount << ',' << cmd.quote_amount;
        break;
    case CommandType::Cancel:
        oss << "CANCEL," << cmd.trader << ',' << cmd.id;
        break;
    case CommandType::Match:
        oss << "MATCH," << join_ids(cmd.buy_ids) << ',' << join_ids(cmd.sell_ids);
        break;
    }
    return oss.str();
}

} // namespace parbook
