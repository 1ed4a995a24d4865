#include "rockswap/core/AI.hpp"

#include <utility>

#include "rockswap/core/Swap.hpp"

namespace rockswap::core::ai {

std::optional<BestMoveResult> BestMove(const Board& board, const ResolveOptions& base) {
    BestMoveResult best{};
    bool has_best = false;

    for (const auto& move : FindLegalMoves(board)) {
        Board sim_board = board;
        if (!TrySwap(sim_board, move)) {
            continue;
        }

        ResolveOptions options = base;
        options.preferred = move.b;
        options.activation = ActivationForSwap(sim_board, move);
        ResolveResult sim = ResolveBoard(sim_board, options);

        if (!has_best || sim.score > best.score) {
            best.move = move;
            best.score = sim.score;
            best.simulation = std::move(sim);
            has_best = true;
        }
    }

    if (!has_best) {
        return std::nullopt;
    }

    return best;
}

}  // namespace rockswap::core::ai
