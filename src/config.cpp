#include "parbook/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

using nlohmann::json;

namespace parbook {

namespace {

std::uint64_t read_positive(const json& j, const char* key, std::uint64_t fallback)
{
    if (!j.contains(key))
        return fallback;

    const auto& v = j.at(key);
    if (!v.is_number_unsigned())
        throw std::runtime_error(std::string("config: '") + key + "' must be a positive integer");

    auto n = v.get<std::uint64_t>();
    if (n == 0)
        throw std::runtime_error(std::string("config: '") + key + "' must be > 0");
    return n;
}

} // namespace

BookConfig config_from_json(const json& j)
{
    if (!j.is_object())
        throw std::runtime_error("config: top level must be a JSON object");

    BookConfig cfg;
    cfg.trader_shards = static_cast<std::size_t>(
        read_positive(j, "trader_shards", cfg.trader_shards));
    return cfg;
}

BookConfig load_config(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw std::runtime_error("config: failed to open " + path);

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("config: " + path + ": " + e.what());
    }
    return config_from_json(j);
}

json to_json(const BookConfig& cfg)
{
    return json{
        {"trader_shards", cfg.trader_shards},
    };
}

} // namespace parbook
