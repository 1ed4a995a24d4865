#pragma once

#include <vector>

#include "rockswap/core/Board.hpp"

namespace rockswap::core {

struct FallEvent {
    Cell from{};
    Cell to{};
    Tile tile{};
};

struct SpawnEvent {
    Cell position{};
    Tile tile{};
    int distance_cells = 1;
};

// Slides every column's tiles down over Empty cells, keeping their order.
std::vector<FallEvent> Collapse(Board& board);

// Fills every Empty cell with a random Normal tile. No anti-match pass.
std::vector<SpawnEvent> Refill(Board& board);

}  // namespace rockswap::core
