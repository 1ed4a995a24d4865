#include <cassert>
#include <iostream>
#include <vector>

#include "BoardFixtures.hpp"
#include "rockswap/core/Cascade.hpp"
#include "rockswap/core/Swap.hpp"

using namespace rockswap::core;
using rockswap::test::Foreign;
using rockswap::test::MakeQuietBoard;
using rockswap::test::Wild;

namespace {

// Bottom row [5, 5, 5, 4, 4, ...]; clearing the 5s drops the 4 sitting at
// (2,6) next to the pair, so a second pass is guaranteed.
Board MakeTwoPassBoard() {
    auto board = MakeQuietBoard();
    for (int col = 0; col <= 2; ++col) {
        board.set(col, 7, Foreign());
    }
    board.set(3, 7, Tile::Normal(4));
    board.set(4, 7, Tile::Normal(4));
    board.set(5, 7, Tile::Normal(0));
    return board;
}

int CountKind(const std::vector<TraceKind>& kinds, TraceKind kind) {
    int count = 0;
    for (auto k : kinds) {
        if (k == kind) {
            ++count;
        }
    }
    return count;
}

void TestChainMultiplierGrows() {
    auto board = MakeTwoPassBoard();
    assert(ScanRuns(board).count() == 3);

    const ResolveResult result = ResolveBoard(board, ResolveOptions{});
    assert(result.passes >= 2);
    assert(!result.hit_pass_limit);
    assert(result.reports[0].chain == 1);
    assert(result.reports[0].points == 3 * kPointsPerTile);
    assert(result.reports[1].chain == 2);
    assert(result.reports[1].base_points >= 3 * kPointsPerTile);
    assert(result.reports[1].points == 2 * result.reports[1].base_points);

    int total = 0;
    for (const auto& report : result.reports) {
        total += report.points;
    }
    assert(total == result.score);
    assert(!ScanRuns(board).any());
    assert(board.countNonEmpty() == 64);
}

void TestPassCeilingStopsGracefully() {
    auto board = MakeTwoPassBoard();
    std::vector<TraceKind> kinds;
    ResolveOptions options;
    options.max_passes = 1;
    const auto result =
        ResolveBoard(board, options, [&](const TraceEvent& event) { kinds.push_back(event.kind); });
    assert(result.passes == 1);
    assert(result.hit_pass_limit);
    assert(CountKind(kinds, TraceKind::PassLimitReached) == 1);
    assert(CountKind(kinds, TraceKind::BoardStable) == 0);
}

void TestStableBoardDoesNothing() {
    auto board = MakeQuietBoard();
    const Board before = board;
    std::vector<TraceKind> kinds;
    const auto result = ResolveBoard(board, ResolveOptions{},
                                     [&](const TraceEvent& event) { kinds.push_back(event.kind); });
    assert(result.passes == 0 && result.score == 0);
    assert(board == before);
    assert(kinds.size() == 1 && kinds[0] == TraceKind::BoardStable);
}

void TestDoubleWildcardSwapWipesBoard() {
    auto board = MakeQuietBoard();
    board.set(3, 3, Wild(1));
    board.set(4, 3, Wild(2));
    const Move move{{3, 3}, {4, 3}};
    const int tiles = board.countNonEmpty();
    assert(TrySwap(board, move));

    const auto activation = ActivationForSwap(board, move);
    assert(activation.has_value() && activation->board_wipe);

    ResolveOptions options;
    options.preferred = move.b;
    options.activation = activation;
    std::vector<TraceKind> kinds;
    const auto result =
        ResolveBoard(board, options, [&](const TraceEvent& event) { kinds.push_back(event.kind); });

    assert(result.reports[0].board_wipe);
    assert(result.reports[0].via_activation);
    assert(result.reports[0].base_points == tiles * kPointsPerTile);
    assert(result.reports[0].points == tiles * kPointsPerTile);
    assert(!result.reports[0].created.has_value());
    assert(CountKind(kinds, TraceKind::BoardWipeFired) == 1);
}

void TestWildcardSwapWipesPartnerColor() {
    auto board = MakeQuietBoard();
    board.set(3, 3, Wild());
    // Partner at (4,3) is color 0; the quiet pattern holds 13 of them.
    const Move move{{3, 3}, {4, 3}};
    assert(TrySwap(board, move));

    const auto activation = ActivationForSwap(board, move);
    assert(activation.has_value() && !activation->board_wipe);
    assert(activation->wildcard == (Cell{4, 3}));
    assert(activation->partner == (Cell{3, 3}));

    const auto mask = ActivationMask(board, *activation);
    assert(mask.count() == 14);

    ResolveOptions options;
    options.activation = activation;
    const auto result = ResolveBoard(board, options);
    assert(result.reports[0].base_points == 14 * kPointsPerTile);
    assert(result.reports[0].color_wipes == 1);
    assert(!result.reports[0].created.has_value());
}

void TestStepperExposesPassBoundaries() {
    auto board = MakeTwoPassBoard();
    std::vector<int> seen_passes;
    CascadeResolver resolver(board, ResolveOptions{});
    assert(!resolver.finished());
    while (resolver.Step()) {
        seen_passes.push_back(resolver.result().passes);
        assert(resolver.chain() == resolver.result().passes + 1);
    }
    assert(resolver.finished());
    assert(!resolver.Step());
    assert(seen_passes.size() == static_cast<std::size_t>(resolver.result().passes));
    for (std::size_t i = 0; i < seen_passes.size(); ++i) {
        assert(seen_passes[i] == static_cast<int>(i) + 1);
    }
}

void TestListenerSeesEveryPass() {
    auto board = MakeTwoPassBoard();
    int calls = 0;
    const auto result = ResolveBoard(board, ResolveOptions{}, {},
                                     [&](const Board& snapshot, const PassReport& report) {
                                         ++calls;
                                         assert(report.pass == calls);
                                         assert(snapshot.countNonEmpty() == 64);
                                         assert(report.matched.any());
                                     });
    assert(calls == result.passes);
}

void TestCascadesTerminateOnRandomPlay() {
    Board::Rules rules;
    for (std::uint32_t seed = 1; seed <= 25; ++seed) {
        auto board = NewBoard(rules, seed);
        for (int turn = 0; turn < 10; ++turn) {
            const auto moves = FindLegalMoves(board);
            if (moves.empty()) {
                break;
            }
            const Move move = moves[static_cast<std::size_t>(turn) % moves.size()];
            assert(TrySwap(board, move));
            ResolveOptions options;
            options.preferred = move.b;
            options.activation = ActivationForSwap(board, move);
            const auto result = ResolveBoard(board, options);
            assert(result.passes >= 1);
            assert(result.passes <= options.max_passes);
            assert(result.score > 0);
            if (!result.hit_pass_limit) {
                assert(!ScanRuns(board).any());
            }
            assert(board.countNonEmpty() == 64);
        }
    }
}

}  // namespace

int main() {
    TestChainMultiplierGrows();
    TestPassCeilingStopsGracefully();
    TestStableBoardDoesNothing();
    TestDoubleWildcardSwapWipesBoard();
    TestWildcardSwapWipesPartnerColor();
    TestStepperExposesPassBoundaries();
    TestListenerSeesEveryPass();
    TestCascadesTerminateOnRandomPlay();
    std::cout << "All cascade tests passed.\n";
    return 0;
}
