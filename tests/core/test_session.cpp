#include <cassert>
#include <iostream>
#include <vector>

#include "BoardFixtures.hpp"
#include "rockswap/core/Runs.hpp"
#include "rockswap/core/Session.hpp"
#include "rockswap/core/Swap.hpp"

using namespace rockswap::core;
using rockswap::test::Foreign;
using rockswap::test::MakeQuietBoard;
using rockswap::test::Wild;

namespace {

Board MakeOneMoveBoard() {
    auto board = MakeQuietBoard();
    board.set(0, 3, Foreign());
    board.set(1, 3, Foreign());
    board.set(3, 3, Foreign());
    return board;
}

const Move kWinningMove{{3, 3}, {2, 3}};

GameConfig SeededConfig() {
    GameConfig config;
    config.seed = 2024;
    return config;
}

void TestNewSessionStartsIdle() {
    GameSession session(SeededConfig());
    assert(session.score() == 0);
    assert(session.moves() == 0);
    assert(!session.resolving());
    assert(session.gameOver() == !AnyLegalMoves(session.board()));
    assert(!ScanRuns(session.board()).any());
    assert(session.board().cols() == 8 && session.board().rows() == 8);
}

void TestRejectedMoveChangesNothing() {
    GameSession session(SeededConfig(), MakeOneMoveBoard());
    const Board before = session.board();
    std::vector<TraceKind> kinds;
    session.setTraceSink([&](const TraceEvent& event) { kinds.push_back(event.kind); });

    const auto outcome = session.PlayMove(Move{{5, 5}, {6, 5}});
    assert(!outcome.accepted);
    assert(session.score() == 0);
    assert(session.moves() == 0);
    assert(session.board() == before);
    assert(!session.resolving());
    assert(kinds.size() == 1 && kinds[0] == TraceKind::SwapRejected);

    assert(!session.PlayMove(Move{{0, 0}, {7, 7}}).accepted);
    assert(!session.PlayMove(Move{{7, 7}, {8, 7}}).accepted);
    assert(session.board() == before);
}

void TestAcceptedMoveScoresAndCounts() {
    GameSession session(SeededConfig(), MakeOneMoveBoard());
    int listener_calls = 0;
    session.setPassListener([&](const Board&, const PassReport&) { ++listener_calls; });

    const auto outcome = session.PlayMove(kWinningMove);
    assert(outcome.accepted);
    assert(outcome.points >= 3 * kPointsPerTile);
    assert(outcome.passes >= 1);
    assert(outcome.passes == listener_calls);
    assert(session.score() == outcome.points);
    assert(session.moves() == 1);
    assert(session.bestScore() == session.score());
    assert(!session.resolving());
    assert(!ScanRuns(session.board()).any() || outcome.hit_pass_limit);
    assert(session.lastOutcome().points == outcome.points);
}

void TestSwapsRejectedWhileResolving() {
    GameSession session(SeededConfig(), MakeOneMoveBoard());
    assert(session.BeginMove(kWinningMove));
    assert(session.resolving());
    assert(session.moves() == 1);

    const Board mid = session.board();
    assert(!session.BeginMove(Move{{0, 0}, {1, 0}}));
    assert(!session.PlayMove(kWinningMove).accepted);
    assert(session.board() == mid);
    assert(!session.Hint().has_value());

    int steps = 0;
    while (session.StepMove()) {
        ++steps;
        assert(session.score() > 0);
    }
    assert(steps >= 1);
    assert(!session.resolving());
    assert(session.moves() == 1);
    assert(!session.StepMove());
}

void TestWildcardPairClearsWholeBoard() {
    auto board = MakeQuietBoard();
    board.set(3, 3, Wild(1));
    board.set(4, 3, Wild(2));
    GameSession session(SeededConfig(), board);

    std::vector<PassReport> reports;
    session.setPassListener(
        [&](const Board&, const PassReport& report) { reports.push_back(report); });
    const auto outcome = session.PlayMove(Move{{3, 3}, {4, 3}});
    assert(outcome.accepted);
    assert(!reports.empty());
    assert(reports[0].board_wipe);
    assert(reports[0].base_points == 64 * kPointsPerTile);
    assert(outcome.points >= 64 * kPointsPerTile);
}

void TestNoMovesMeansGameOver() {
    GameSession session(SeededConfig(), MakeQuietBoard());
    assert(session.gameOver());
    assert(!session.PlayMove(Move{{0, 0}, {1, 0}}).accepted);
    assert(!session.Hint().has_value());
}

void TestResetKeepsBestScore() {
    GameSession session(SeededConfig(), MakeOneMoveBoard());
    session.PlayMove(kWinningMove);
    const int best = session.bestScore();
    assert(best > 0);

    session.Reset(77);
    assert(session.score() == 0);
    assert(session.moves() == 0);
    assert(session.bestScore() == best);
    assert(!ScanRuns(session.board()).any());

    session.setBestScore(best + 500);
    assert(session.bestScore() == best + 500);
    session.setBestScore(1);
    assert(session.bestScore() == best + 500);
}

void TestHintIsPlayable() {
    GameSession session(SeededConfig(), MakeOneMoveBoard());
    const auto hint = session.Hint();
    assert(hint.has_value());
    const auto outcome = session.PlayMove(hint->move);
    assert(outcome.accepted);
    // The hint replays the session's own random stream, so its forecast is exact.
    assert(outcome.points == hint->score);
}

void TestConfigDrivesScoring() {
    GameConfig config = SeededConfig();
    config.points_per_tile = 7;
    GameSession session(config, MakeOneMoveBoard());
    std::vector<PassReport> reports;
    session.setPassListener(
        [&](const Board&, const PassReport& report) { reports.push_back(report); });
    session.PlayMove(kWinningMove);
    assert(reports[0].base_points == 3 * 7);
}

}  // namespace

int main() {
    TestNewSessionStartsIdle();
    TestRejectedMoveChangesNothing();
    TestAcceptedMoveScoresAndCounts();
    TestSwapsRejectedWhileResolving();
    TestWildcardPairClearsWholeBoard();
    TestNoMovesMeansGameOver();
    TestResetKeepsBestScore();
    TestHintIsPlayable();
    TestConfigDrivesScoring();
    std::cout << "All session tests passed.\n";
    return 0;
}
