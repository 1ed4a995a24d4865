#include "rockswap/core/Swap.hpp"

#include "rockswap/core/Runs.hpp"

namespace rockswap::core {

namespace {

// Expects the tentative swap to already be applied.
bool SwappedCellsMatch(const Board& board, const Move& move) {
    if (board.get(move.a).isWildcard() || board.get(move.b).isWildcard()) {
        return true;
    }
    return HasMatchAt(board, move.a) || HasMatchAt(board, move.b);
}

template <typename Visitor>
void ForEachAdjacentPair(const Board& board, Visitor&& visit) {
    for (int col = 0; col < board.cols(); ++col) {
        for (int row = 0; row < board.rows(); ++row) {
            const Cell origin{col, row};
            const Cell neighbors[2] = {{col + 1, row}, {col, row + 1}};
            for (const auto& neighbor : neighbors) {
                if (!board.inBounds(neighbor)) {
                    continue;
                }
                if (!visit(Move{origin, neighbor})) {
                    return;
                }
            }
        }
    }
}

}  // namespace

bool SwapPreconditionsHold(const Board& board, const Move& move) {
    if (!board.inBounds(move.a) || !board.inBounds(move.b)) {
        return false;
    }
    if (ManhattanDistance(move.a, move.b) != 1) {
        return false;
    }
    return !board.get(move.a).empty() && !board.get(move.b).empty();
}

bool LegalSwap(Board& board, const Move& move) {
    if (!SwapPreconditionsHold(board, move)) {
        return false;
    }
    board.swapCells(move);
    const bool ok = SwappedCellsMatch(board, move);
    board.swapCells(move);
    return ok;
}

bool TrySwap(Board& board, const Move& move) {
    if (!SwapPreconditionsHold(board, move)) {
        return false;
    }
    board.swapCells(move);
    if (SwappedCellsMatch(board, move)) {
        return true;
    }
    board.swapCells(move);
    return false;
}

bool AnyLegalMoves(const Board& board) {
    Board scratch = board;
    bool found = false;
    ForEachAdjacentPair(scratch, [&](const Move& move) {
        found = LegalSwap(scratch, move);
        return !found;
    });
    return found;
}

std::vector<Move> FindLegalMoves(const Board& board) {
    Board scratch = board;
    std::vector<Move> moves;
    ForEachAdjacentPair(scratch, [&](const Move& move) {
        if (LegalSwap(scratch, move)) {
            moves.push_back(move);
        }
        return true;
    });
    return moves;
}

}  // namespace rockswap::core
