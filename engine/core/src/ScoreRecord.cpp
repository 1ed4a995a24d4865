#include "rockswap/core/ScoreRecord.hpp"

#include <algorithm>

namespace rockswap::core {

bool ScoreRecord::Submit(int final_score) {
    ++games_played;
    if (final_score > best_score) {
        best_score = final_score;
        return true;
    }
    return false;
}

Json ScoreRecord::ToJson() const {
    Json json;
    json["version"] = version;
    json["best_score"] = best_score;
    json["games_played"] = games_played;
    return json;
}

ScoreRecord ScoreRecord::FromJson(const Json& json) {
    ScoreRecord record;
    if (json.contains("version") && json["version"].is_number_integer()) {
        record.version = json["version"].get<int>();
    }
    if (json.contains("best_score") && json["best_score"].is_number_integer()) {
        record.best_score = std::max(json["best_score"].get<int>(), 0);
    }
    if (json.contains("games_played") && json["games_played"].is_number_integer()) {
        record.games_played = std::max(json["games_played"].get<int>(), 0);
    }
    return record;
}

std::string ScoreRecord::Serialize() const {
    return ToJson().dump();
}

ScoreRecord ScoreRecord::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

std::vector<std::uint8_t> ScoreRecord::SerializeBinary() const {
    return Json::to_msgpack(ToJson());
}

ScoreRecord ScoreRecord::DeserializeBinary(const std::vector<std::uint8_t>& bytes) {
    auto json = Json::from_msgpack(bytes);
    return FromJson(json);
}

}  // namespace rockswap::core
