#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace parbook {

struct BookConfig {
    std::size_t trader_shards = 64;
};

/// Reads the optional "trader_shards" key from a JSON object.
/// Missing keys keep their defaults, unknown keys are ignored.
/// Throws std::runtime_error on a wrong type or a zero value.
BookConfig config_from_json(const nlohmann::json& j);

/// Parses the file at path with config_from_json.
BookConfig load_config(const std::string& path);

nlohmann::json to_json(const BookConfig& cfg);

} // namespace parbook
