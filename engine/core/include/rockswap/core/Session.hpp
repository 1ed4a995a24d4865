#pragma once

#include <cstdint>
#include <optional>
#include <utility>

#include "rockswap/core/AI.hpp"
#include "rockswap/core/Board.hpp"
#include "rockswap/core/Cascade.hpp"
#include "rockswap/core/GameConfig.hpp"
#include "rockswap/core/Trace.hpp"

namespace rockswap::core {

struct MoveOutcome {
    bool accepted = false;
    int points = 0;
    int passes = 0;
    int cleared = 0;
    bool hit_pass_limit = false;
    bool game_over = false;
};

// One player's game: the board plus score, move count and game-over state.
// A move is Idle -> Resolving -> Idle; swaps arriving while Resolving are
// rejected.
class GameSession {
public:
    explicit GameSession(const GameConfig& config = {});
    GameSession(const GameConfig& config, std::uint32_t seed);
    // Resumes play on an existing board; its dimensions override the config.
    GameSession(const GameConfig& config, Board board);

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    const Board& board() const noexcept { return board_; }
    const GameConfig& config() const noexcept { return config_; }

    int score() const noexcept { return score_; }
    int moves() const noexcept { return moves_; }
    int bestScore() const noexcept { return best_score_; }
    bool gameOver() const noexcept { return game_over_; }
    bool resolving() const noexcept { return resolver_.has_value(); }

    // Seeds the in-memory best score, e.g. from a stored record.
    void setBestScore(int best) noexcept;

    void setTraceSink(TraceSink sink) { trace_ = std::move(sink); }
    void setPassListener(PassListener listener) { listener_ = std::move(listener); }

    // Validates and commits the swap, then enters Resolving. Nothing changes
    // when it returns false.
    bool BeginMove(const Move& move);

    // Runs one cascade pass of the current move. Returns false once the move
    // is fully resolved and the session is Idle again.
    bool StepMove();

    // BeginMove followed by every pass.
    MoveOutcome PlayMove(const Move& move);

    // Outcome of the last move that finished resolving.
    const MoveOutcome& lastOutcome() const noexcept { return last_outcome_; }

    void Reset();
    void Reset(std::uint32_t seed);

    // Best scoring legal move on the current board, if any.
    std::optional<ai::BestMoveResult> Hint() const;

private:
    void RejectSwap(const Move& move) const;
    void FinishMove();
    ResolveOptions BaseResolveOptions() const;

    GameConfig config_;
    Board board_;
    int score_ = 0;
    int moves_ = 0;
    int best_score_ = 0;
    bool game_over_ = false;
    int move_start_score_ = 0;
    std::optional<CascadeResolver> resolver_;
    MoveOutcome last_outcome_{};
    TraceSink trace_;
    PassListener listener_;
};

}  // namespace rockswap::core
