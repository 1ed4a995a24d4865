#include "rockswap/core/GameConfig.hpp"

#include <algorithm>

namespace rockswap::core {

namespace {

constexpr int kMinSide = 3;
constexpr int kMaxSide = 64;
constexpr int kMinTileTypes = 3;
constexpr int kMaxTileTypes = 16;

void ReadInt(const Json& json, const char* key, int& out) {
    if (json.contains(key) && json[key].is_number_integer()) {
        out = json[key].get<int>();
    }
}

}  // namespace

GameConfig GameConfig::Sanitized() const {
    GameConfig config = *this;
    config.cols = std::clamp(cols, kMinSide, kMaxSide);
    config.rows = std::clamp(rows, kMinSide, kMaxSide);
    config.tile_types = std::clamp(tile_types, kMinTileTypes, kMaxTileTypes);
    config.points_per_tile = std::max(points_per_tile, 1);
    config.max_passes = std::max(max_passes, 1);
    config.move_limit = std::max(move_limit, 0);
    return config;
}

Json GameConfig::ToJson() const {
    Json json;
    json["cols"] = cols;
    json["rows"] = rows;
    json["tile_types"] = tile_types;
    json["points_per_tile"] = points_per_tile;
    json["max_passes"] = max_passes;
    json["move_limit"] = move_limit;
    if (seed) {
        json["seed"] = *seed;
    } else {
        json["seed"] = nullptr;
    }
    return json;
}

GameConfig GameConfig::FromJson(const Json& json) {
    GameConfig config;
    if (!json.is_object()) {
        return config;
    }
    ReadInt(json, "cols", config.cols);
    ReadInt(json, "rows", config.rows);
    ReadInt(json, "tile_types", config.tile_types);
    ReadInt(json, "points_per_tile", config.points_per_tile);
    ReadInt(json, "max_passes", config.max_passes);
    ReadInt(json, "move_limit", config.move_limit);
    if (json.contains("seed") && json["seed"].is_number_unsigned()) {
        config.seed = json["seed"].get<std::uint32_t>();
    }
    return config;
}

std::string GameConfig::Serialize() const {
    return ToJson().dump(2);
}

GameConfig GameConfig::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

}  // namespace rockswap::core
