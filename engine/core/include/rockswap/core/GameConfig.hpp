#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "rockswap/core/Board.hpp"
#include "rockswap/core/Cascade.hpp"
#include "rockswap/core/Clear.hpp"
#include "rockswap/core/Json.hpp"

namespace rockswap::core {

struct GameConfig {
    int cols = 8;
    int rows = 8;
    int tile_types = 6;
    int points_per_tile = kPointsPerTile;
    int max_passes = kDefaultMaxPasses;
    // 0 means unlimited. Only the headless driver reads it.
    int move_limit = 0;
    std::optional<std::uint32_t> seed;

    Board::Rules boardRules() const { return Board::Rules{cols, rows, tile_types}; }

    // Copy with every field clamped into a playable range.
    GameConfig Sanitized() const;

    Json ToJson() const;
    static GameConfig FromJson(const Json& json);

    std::string Serialize() const;
    static GameConfig Deserialize(const std::string& json_string);
};

}  // namespace rockswap::core
