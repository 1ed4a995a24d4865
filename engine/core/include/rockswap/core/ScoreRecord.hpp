#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "rockswap/core/Json.hpp"

namespace rockswap::core {

// Best-score document handed to the persistence layer.
struct ScoreRecord {
    int version = 1;
    int best_score = 0;
    int games_played = 0;

    // Counts a finished game; true when it set a new best.
    bool Submit(int final_score);

    Json ToJson() const;
    static ScoreRecord FromJson(const Json& json);

    std::string Serialize() const;
    static ScoreRecord Deserialize(const std::string& json_string);

    std::vector<std::uint8_t> SerializeBinary() const;
    static ScoreRecord DeserializeBinary(const std::vector<std::uint8_t>& bytes);
};

}  // namespace rockswap::core
