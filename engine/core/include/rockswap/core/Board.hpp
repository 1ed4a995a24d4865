#pragma once

#include <random>
#include <vector>

#include "rockswap/core/Tile.hpp"
#include "rockswap/core/Types.hpp"

namespace rockswap::core {

class Board {
public:
    struct Rules {
        int cols = 8;
        int rows = 8;
        int tile_types = 6;
    };

    Board() = default;
    Board(int cols, int rows, int tile_types, std::uint32_t seed = std::random_device{}());
    explicit Board(const Rules& rules, std::uint32_t seed = std::random_device{}());

    int cols() const noexcept { return cols_; }
    int rows() const noexcept { return rows_; }
    int tileTypes() const noexcept { return tile_types_; }
    Rules rules() const noexcept { return Rules{cols_, rows_, tile_types_}; }

    bool inBounds(int col, int row) const noexcept;
    bool inBounds(const Cell& cell) const noexcept { return inBounds(cell.col, cell.row); }

    // Out-of-bounds reads yield Empty; out-of-bounds writes are ignored.
    Tile get(int col, int row) const noexcept;
    Tile get(const Cell& cell) const noexcept { return get(cell.col, cell.row); }

    void set(int col, int row, const Tile& tile) noexcept;
    void set(const Cell& cell, const Tile& tile) noexcept { set(cell.col, cell.row, tile); }

    void swapCells(const Cell& a, const Cell& b) noexcept;
    void swapCells(const Move& move) noexcept { swapCells(move.a, move.b); }

    int randomColor();
    Tile randomTile() { return Tile::Normal(randomColor()); }

    void fillAll(const Tile& tile);
    int countNonEmpty() const noexcept;

    const std::vector<Tile>& cells() const noexcept { return cells_; }

private:
    int index(int col, int row) const noexcept;

    int cols_{0};
    int rows_{0};
    int tile_types_{0};
    std::vector<Tile> cells_;
    std::mt19937 rng_{};
};

// Compares dimensions and cell contents; the random stream is not part of equality.
bool operator==(const Board& lhs, const Board& rhs) noexcept;
bool operator!=(const Board& lhs, const Board& rhs) noexcept;

// Fills a fresh board so that no row or column starts with a run of three.
Board NewBoard(const Board::Rules& rules, std::uint32_t seed = std::random_device{}());

// True when placing board[col,row] completed a run with its two left or two upper neighbours.
bool CompletesRunBackward(const Board& board, int col, int row);

}  // namespace rockswap::core
