#pragma once

#include <cstdint>
#include <cstdlib>

namespace rockswap::core {

struct Cell {
    std::int32_t col{};
    std::int32_t row{};

    constexpr bool operator==(const Cell& other) const noexcept {
        return col == other.col && row == other.row;
    }

    constexpr bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }

    constexpr bool operator<(const Cell& other) const noexcept {
        return col < other.col || (col == other.col && row < other.row);
    }
};

struct Move {
    Cell a{};
    Cell b{};
};

inline int ManhattanDistance(const Cell& a, const Cell& b) noexcept {
    return std::abs(a.col - b.col) + std::abs(a.row - b.row);
}

}  // namespace rockswap::core
