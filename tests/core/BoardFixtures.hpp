#pragma once

#include "rockswap/core/Board.hpp"

namespace rockswap::test {

// Color 5 never appears in the quiet pattern, so tests place it freely.
inline constexpr int kForeign = 5;

// (col + 2 * row) % 5 over a six-color palette: no runs, no legal swaps, and
// no Wildcard dropped into it completes a run.
inline core::Board MakeQuietBoard(int cols = 8, int rows = 8, std::uint32_t seed = 7) {
    core::Board board(cols, rows, 6, seed);
    for (int col = 0; col < cols; ++col) {
        for (int row = 0; row < rows; ++row) {
            board.set(col, row, core::Tile::Normal((col + 2 * row) % 5));
        }
    }
    return board;
}

inline core::Tile Foreign() {
    return core::Tile::Normal(kForeign);
}

inline core::Tile Wild(int color = 1) {
    return core::Tile::Special(color, core::SpecialKind::Wildcard);
}

}  // namespace rockswap::test
