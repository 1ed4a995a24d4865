#include "rockswap/core/Runs.hpp"

#include <algorithm>

namespace rockswap::core {

namespace {

constexpr int kMinRunLength = 3;

// Marks qualifying blocks of one line in `hits`. A block runs while tiles are
// Wildcards or match the first real color; the breaking tile starts the next.
void ScanLine(const std::vector<Tile>& line, std::vector<bool>& hits) {
    const int size = static_cast<int>(line.size());
    hits.assign(line.size(), false);

    int start = 0;
    while (start < size) {
        if (line[start].empty()) {
            ++start;
            continue;
        }

        int adopted = -1;
        int end = start;
        while (end < size && !line[end].empty()) {
            const Tile& tile = line[end];
            if (!tile.isWildcard()) {
                if (adopted < 0) {
                    adopted = tile.color();
                } else if (tile.color() != adopted) {
                    break;
                }
            }
            ++end;
        }

        if (adopted >= 0 && end - start >= kMinRunLength) {
            std::fill(hits.begin() + start, hits.begin() + end, true);
        }

        start = end;
    }
}

std::vector<Tile> RowTiles(const Board& board, int row) {
    std::vector<Tile> line;
    line.reserve(static_cast<std::size_t>(board.cols()));
    for (int col = 0; col < board.cols(); ++col) {
        line.push_back(board.get(col, row));
    }
    return line;
}

std::vector<Tile> ColumnTiles(const Board& board, int col) {
    std::vector<Tile> line;
    line.reserve(static_cast<std::size_t>(board.rows()));
    for (int row = 0; row < board.rows(); ++row) {
        line.push_back(board.get(col, row));
    }
    return line;
}

}  // namespace

ClearMask::ClearMask(int cols, int rows)
    : cols_(std::max(cols, 0)),
      rows_(std::max(rows, 0)),
      bits_(static_cast<std::size_t>(cols_) * static_cast<std::size_t>(rows_), 0) {}

ClearMask ClearMask::Full(const Board& board) {
    ClearMask mask(board);
    std::fill(mask.bits_.begin(), mask.bits_.end(), 1);
    return mask;
}

ClearMask ClearMask::FromCells(const Board& board, const std::vector<Cell>& cells) {
    ClearMask mask(board);
    for (const auto& cell : cells) {
        mask.set(cell);
    }
    return mask;
}

bool ClearMask::inBounds(const Cell& cell) const noexcept {
    return cell.col >= 0 && cell.col < cols_ && cell.row >= 0 && cell.row < rows_;
}

bool ClearMask::test(const Cell& cell) const noexcept {
    if (!inBounds(cell)) {
        return false;
    }
    return bits_[static_cast<std::size_t>(cell.col * rows_ + cell.row)] != 0;
}

void ClearMask::set(const Cell& cell, bool value) noexcept {
    if (!inBounds(cell)) {
        return;
    }
    bits_[static_cast<std::size_t>(cell.col * rows_ + cell.row)] = value ? 1 : 0;
}

bool ClearMask::any() const noexcept {
    return std::any_of(bits_.begin(), bits_.end(), [](std::uint8_t bit) { return bit != 0; });
}

int ClearMask::count() const noexcept {
    return static_cast<int>(
        std::count_if(bits_.begin(), bits_.end(), [](std::uint8_t bit) { return bit != 0; }));
}

std::vector<Cell> ClearMask::cells() const {
    std::vector<Cell> out;
    for (int col = 0; col < cols_; ++col) {
        for (int row = 0; row < rows_; ++row) {
            if (bits_[static_cast<std::size_t>(col * rows_ + row)] != 0) {
                out.push_back(Cell{col, row});
            }
        }
    }
    return out;
}

void ClearMask::merge(const ClearMask& other) noexcept {
    const int cols = std::min(cols_, other.cols_);
    const int rows = std::min(rows_, other.rows_);
    for (int col = 0; col < cols; ++col) {
        for (int row = 0; row < rows; ++row) {
            if (other.test(Cell{col, row})) {
                set(Cell{col, row});
            }
        }
    }
}

bool ColorRun::contains(const Cell& cell) const noexcept {
    if (axis == Axis::Horizontal) {
        return cell.row == start.row && cell.col >= start.col && cell.col < start.col + length;
    }
    return cell.col == start.col && cell.row >= start.row && cell.row < start.row + length;
}

ClearMask ScanRuns(const Board& board) {
    ClearMask mask(board);
    std::vector<bool> hits;

    for (int row = 0; row < board.rows(); ++row) {
        ScanLine(RowTiles(board, row), hits);
        for (int col = 0; col < board.cols(); ++col) {
            if (hits[static_cast<std::size_t>(col)]) {
                mask.set(Cell{col, row});
            }
        }
    }

    for (int col = 0; col < board.cols(); ++col) {
        ScanLine(ColumnTiles(board, col), hits);
        for (int row = 0; row < board.rows(); ++row) {
            if (hits[static_cast<std::size_t>(row)]) {
                mask.set(Cell{col, row});
            }
        }
    }

    return mask;
}

bool HasMatchAt(const Board& board, int col, int row) {
    if (!board.inBounds(col, row) || board.get(col, row).empty()) {
        return false;
    }
    std::vector<bool> hits;
    ScanLine(RowTiles(board, row), hits);
    if (hits[static_cast<std::size_t>(col)]) {
        return true;
    }
    ScanLine(ColumnTiles(board, col), hits);
    return hits[static_cast<std::size_t>(row)];
}

bool HasMatchAt(const Board& board, const Cell& cell) {
    return HasMatchAt(board, cell.col, cell.row);
}

std::vector<ColorRun> FindColorRuns(const Board& board) {
    std::vector<ColorRun> runs;

    for (int row = 0; row < board.rows(); ++row) {
        int col = 0;
        while (col < board.cols()) {
            const Tile tile = board.get(col, row);
            if (tile.empty() || tile.isWildcard()) {
                ++col;
                continue;
            }
            int start = col;
            while (col + 1 < board.cols() && SameColor(board.get(col + 1, row), tile)) {
                ++col;
            }
            if (col - start + 1 >= kMinRunLength) {
                runs.push_back(ColorRun{ColorRun::Axis::Horizontal, tile.color(), Cell{start, row},
                                        col - start + 1});
            }
            ++col;
        }
    }

    for (int col = 0; col < board.cols(); ++col) {
        int row = 0;
        while (row < board.rows()) {
            const Tile tile = board.get(col, row);
            if (tile.empty() || tile.isWildcard()) {
                ++row;
                continue;
            }
            int start = row;
            while (row + 1 < board.rows() && SameColor(board.get(col, row + 1), tile)) {
                ++row;
            }
            if (row - start + 1 >= kMinRunLength) {
                runs.push_back(ColorRun{ColorRun::Axis::Vertical, tile.color(), Cell{col, start},
                                        row - start + 1});
            }
            ++row;
        }
    }

    return runs;
}

}  // namespace rockswap::core
