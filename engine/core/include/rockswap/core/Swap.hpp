#pragma once

#include <vector>

#include "rockswap/core/Board.hpp"

namespace rockswap::core {

// Both cells on the board, orthogonally adjacent and non-empty.
bool SwapPreconditionsHold(const Board& board, const Move& move);

// Decides whether `move` is a legal player move. The board is swapped
// tentatively and always restored before returning.
bool LegalSwap(Board& board, const Move& move);

// Commits `move` when legal. On rejection the board is left untouched.
bool TrySwap(Board& board, const Move& move);

bool AnyLegalMoves(const Board& board);

// Every legal move, each adjacent pair listed once (right and down neighbours).
std::vector<Move> FindLegalMoves(const Board& board);

}  // namespace rockswap::core
