#pragma once

#include <optional>

#include "rockswap/core/Cascade.hpp"

namespace rockswap::core::ai {

struct BestMoveResult {
    Move move{};
    int score = 0;
    ResolveResult simulation{};
};

// Plays every legal move on a scratch copy of the board, random stream
// included, and keeps the highest scoring one. Ties keep the earliest move.
std::optional<BestMoveResult> BestMove(const Board& board, const ResolveOptions& base = {});

}  // namespace rockswap::core::ai
