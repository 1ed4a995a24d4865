#include <cassert>
#include <iostream>

#include "BoardFixtures.hpp"
#include "rockswap/core/Gravity.hpp"

using namespace rockswap::core;
using rockswap::test::MakeQuietBoard;

namespace {

void TestCollapseKeepsColumnOrder() {
    auto board = MakeQuietBoard(3, 6);
    const Tile top = board.get(1, 0);
    const Tile second = board.get(1, 1);
    const Tile bottom = board.get(1, 5);
    board.set(1, 2, Tile::Empty());
    board.set(1, 4, Tile::Empty());

    const auto falls = Collapse(board);
    assert(board.get(1, 0).empty());
    assert(board.get(1, 1).empty());
    assert(board.get(1, 2) == top);
    assert(board.get(1, 3) == second);
    assert(board.get(1, 5) == bottom);
    // Rows 0, 1 and 3 each fell; the untouched columns produced nothing.
    assert(falls.size() == 3);
    for (const auto& fall : falls) {
        assert(fall.from.col == 1 && fall.to.col == 1);
        assert(fall.to.row > fall.from.row);
    }
}

void TestCollapseIsStableWhenFull() {
    auto board = MakeQuietBoard();
    const Board before = board;
    assert(Collapse(board).empty());
    assert(board == before);
}

void TestRefillFillsEveryHole() {
    auto board = MakeQuietBoard();
    for (int col = 0; col < board.cols(); ++col) {
        board.set(col, 0, Tile::Empty());
    }
    board.set(3, 1, Tile::Empty());
    board.set(3, 0, Tile::Empty());

    const auto spawns = Refill(board);
    assert(spawns.size() == 9);
    assert(board.countNonEmpty() == board.cols() * board.rows());
    for (const auto& spawn : spawns) {
        assert(spawn.tile.isNormal());
        assert(spawn.tile.color() >= 0 && spawn.tile.color() < board.tileTypes());
        assert(board.get(spawn.position) == spawn.tile);
        assert(spawn.distance_cells >= 1);
    }
}

void TestCollapseThenRefill() {
    auto board = MakeQuietBoard();
    board.set(2, 7, Tile::Empty());
    board.set(2, 6, Tile::Empty());
    const Tile survivor = board.get(2, 5);
    Collapse(board);
    assert(board.get(2, 7) == survivor);
    Refill(board);
    assert(board.countNonEmpty() == 64);
    assert(board.get(2, 0).isNormal() && board.get(2, 1).isNormal());
}

}  // namespace

int main() {
    TestCollapseKeepsColumnOrder();
    TestCollapseIsStableWhenFull();
    TestRefillFillsEveryHole();
    TestCollapseThenRefill();
    std::cout << "All gravity tests passed.\n";
    return 0;
}
