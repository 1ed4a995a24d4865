#pragma once

#include <filesystem>

#include "rockswap/core/ScoreRecord.hpp"

namespace rockswap::platform {

// Keeps the best-score record as a MessagePack file under the SDL pref path.
class SdlScoreStore {
public:
    explicit SdlScoreStore(std::filesystem::path root = {});

    bool Initialize();

    // False when no record exists yet or it cannot be decoded; `out` is left untouched.
    bool Load(core::ScoreRecord& out) const;
    bool Save(const core::ScoreRecord& record);
    bool Clear();

    const std::filesystem::path& root() const { return root_; }
    const std::filesystem::path& recordPath() const { return record_path_; }

private:
    bool EnsureRootExists() const;

    std::filesystem::path root_;
    std::filesystem::path record_path_;
};

}  // namespace rockswap::platform
