#pragma once

#include <cstdint>
#include <vector>

#include "rockswap/core/Board.hpp"

namespace rockswap::core {

// Per-cell flag set over a board, used both for matches and for clears.
class ClearMask {
public:
    ClearMask() = default;
    ClearMask(int cols, int rows);
    explicit ClearMask(const Board& board) : ClearMask(board.cols(), board.rows()) {}

    static ClearMask Full(const Board& board);
    static ClearMask FromCells(const Board& board, const std::vector<Cell>& cells);

    int cols() const noexcept { return cols_; }
    int rows() const noexcept { return rows_; }

    bool inBounds(const Cell& cell) const noexcept;

    bool test(const Cell& cell) const noexcept;
    void set(const Cell& cell, bool value = true) noexcept;

    bool any() const noexcept;
    int count() const noexcept;

    // Marked cells in column-major order.
    std::vector<Cell> cells() const;

    void merge(const ClearMask& other) noexcept;

    bool operator==(const ClearMask& other) const noexcept {
        return cols_ == other.cols_ && rows_ == other.rows_ && bits_ == other.bits_;
    }
    bool operator!=(const ClearMask& other) const noexcept { return !(*this == other); }

private:
    int cols_{0};
    int rows_{0};
    std::vector<std::uint8_t> bits_;
};

// Straight run of non-Wildcard tiles sharing one base color.
struct ColorRun {
    enum class Axis { Horizontal, Vertical };

    Axis axis = Axis::Horizontal;
    int color = 0;
    Cell start{};
    int length = 0;

    Cell at(int offset) const noexcept {
        return axis == Axis::Horizontal ? Cell{start.col + offset, start.row}
                                        : Cell{start.col, start.row + offset};
    }

    bool contains(const Cell& cell) const noexcept;

    Cell midpoint() const noexcept { return at((length - 1) / 2); }
};

// Marks every cell belonging to a qualifying row or column run. Wildcards
// join any run; a run needs three cells and at least one real color.
ClearMask ScanRuns(const Board& board);

bool HasMatchAt(const Board& board, int col, int row);
bool HasMatchAt(const Board& board, const Cell& cell);

// Maximal runs of length >= 3 ignoring Wildcards, rows top to bottom then
// columns left to right.
std::vector<ColorRun> FindColorRuns(const Board& board);

}  // namespace rockswap::core
