#include "rockswap/core/Board.hpp"

#include <algorithm>

namespace rockswap::core {

namespace {

constexpr int kMaxRerolls = 32;

}  // namespace

Board::Board(int cols, int rows, int tile_types, std::uint32_t seed)
    : cols_(std::max(cols, 0)),
      rows_(std::max(rows, 0)),
      tile_types_(std::max(tile_types, 0)),
      cells_(static_cast<std::size_t>(cols_) * static_cast<std::size_t>(rows_), Tile::Empty()),
      rng_(seed) {}

Board::Board(const Rules& rules, std::uint32_t seed)
    : Board(rules.cols, rules.rows, rules.tile_types, seed) {}

bool Board::inBounds(int col, int row) const noexcept {
    return col >= 0 && col < cols_ && row >= 0 && row < rows_;
}

Tile Board::get(int col, int row) const noexcept {
    if (!inBounds(col, row)) {
        return Tile::Empty();
    }
    return cells_[index(col, row)];
}

void Board::set(int col, int row, const Tile& tile) noexcept {
    if (!inBounds(col, row)) {
        return;
    }
    cells_[index(col, row)] = tile;
}

void Board::swapCells(const Cell& a, const Cell& b) noexcept {
    if (!inBounds(a) || !inBounds(b)) {
        return;
    }
    auto idx_a = index(a.col, a.row);
    auto idx_b = index(b.col, b.row);
    std::swap(cells_[idx_a], cells_[idx_b]);
}

int Board::randomColor() {
    if (tile_types_ <= 0) {
        return 0;
    }
    std::uniform_int_distribution<int> dist(0, tile_types_ - 1);
    return dist(rng_);
}

void Board::fillAll(const Tile& tile) {
    std::fill(cells_.begin(), cells_.end(), tile);
}

int Board::countNonEmpty() const noexcept {
    return static_cast<int>(std::count_if(cells_.begin(), cells_.end(),
                                          [](const Tile& tile) { return !tile.empty(); }));
}

int Board::index(int col, int row) const noexcept {
    return col * rows_ + row;
}

bool operator==(const Board& lhs, const Board& rhs) noexcept {
    return lhs.cols() == rhs.cols() && lhs.rows() == rhs.rows() && lhs.cells() == rhs.cells();
}

bool operator!=(const Board& lhs, const Board& rhs) noexcept {
    return !(lhs == rhs);
}

bool CompletesRunBackward(const Board& board, int col, int row) {
    const Tile tile = board.get(col, row);
    if (tile.empty()) {
        return false;
    }
    if (col >= 2 && SameColor(board.get(col - 1, row), tile) &&
        SameColor(board.get(col - 2, row), tile)) {
        return true;
    }
    return row >= 2 && SameColor(board.get(col, row - 1), tile) &&
           SameColor(board.get(col, row - 2), tile);
}

Board NewBoard(const Board::Rules& rules, std::uint32_t seed) {
    Board board(rules, seed);
    for (int row = 0; row < board.rows(); ++row) {
        for (int col = 0; col < board.cols(); ++col) {
            board.set(col, row, board.randomTile());
            int tries = 0;
            while (CompletesRunBackward(board, col, row) && tries < kMaxRerolls) {
                board.set(col, row, board.randomTile());
                ++tries;
            }
            if (!CompletesRunBackward(board, col, row)) {
                continue;
            }
            // Unlucky streak: walk the palette for the first color that fits.
            for (int color = 0; color < board.tileTypes(); ++color) {
                board.set(col, row, Tile::Normal(color));
                if (!CompletesRunBackward(board, col, row)) {
                    break;
                }
            }
        }
    }
    return board;
}

}  // namespace rockswap::core
