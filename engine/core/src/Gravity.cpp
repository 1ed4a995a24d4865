#include "rockswap/core/Gravity.hpp"

#include <algorithm>

namespace rockswap::core {

std::vector<FallEvent> Collapse(Board& board) {
    std::vector<FallEvent> falls;
    for (int col = 0; col < board.cols(); ++col) {
        int write = board.rows() - 1;
        for (int row = board.rows() - 1; row >= 0; --row) {
            const Tile tile = board.get(col, row);
            if (tile.empty()) {
                continue;
            }
            if (write != row) {
                board.set(col, write, tile);
                board.set(col, row, Tile::Empty());
                falls.push_back(FallEvent{Cell{col, row}, Cell{col, write}, tile});
            }
            --write;
        }
    }
    return falls;
}

std::vector<SpawnEvent> Refill(Board& board) {
    std::vector<SpawnEvent> spawns;
    for (int col = 0; col < board.cols(); ++col) {
        int holes = 0;
        for (int row = 0; row < board.rows(); ++row) {
            if (board.get(col, row).empty()) {
                ++holes;
            }
        }

        int spawn_index = 0;
        for (int row = board.rows() - 1; row >= 0; --row) {
            if (!board.get(col, row).empty()) {
                continue;
            }
            const Tile tile = board.randomTile();
            board.set(col, row, tile);
            spawns.push_back(SpawnEvent{Cell{col, row}, tile, std::max(1, holes - spawn_index)});
            ++spawn_index;
        }
    }
    return spawns;
}

}  // namespace rockswap::core
