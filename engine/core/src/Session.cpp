#include "rockswap/core/Session.hpp"

#include <algorithm>
#include <random>
#include <utility>

#include "rockswap/core/Swap.hpp"

namespace rockswap::core {

namespace {

std::uint32_t ResolveSeed(const GameConfig& config) {
    if (config.seed) {
        return *config.seed;
    }
    return std::random_device{}();
}

}  // namespace

GameSession::GameSession(const GameConfig& config)
    : GameSession(config, ResolveSeed(config)) {}

GameSession::GameSession(const GameConfig& config, std::uint32_t seed)
    : config_(config.Sanitized()), board_(NewBoard(config_.boardRules(), seed)) {
    game_over_ = !AnyLegalMoves(board_);
}

GameSession::GameSession(const GameConfig& config, Board board)
    : config_(config.Sanitized()), board_(std::move(board)) {
    config_.cols = board_.cols();
    config_.rows = board_.rows();
    config_.tile_types = board_.tileTypes();
    game_over_ = !AnyLegalMoves(board_);
}

void GameSession::setBestScore(int best) noexcept {
    best_score_ = std::max({best_score_, best, score_});
}

ResolveOptions GameSession::BaseResolveOptions() const {
    ResolveOptions options;
    options.points_per_tile = config_.points_per_tile;
    options.max_passes = config_.max_passes;
    return options;
}

void GameSession::RejectSwap(const Move& move) const {
    TraceEvent event;
    event.kind = TraceKind::SwapRejected;
    event.move = move;
    Emit(trace_, event);
}

bool GameSession::BeginMove(const Move& move) {
    if (resolving() || game_over_) {
        RejectSwap(move);
        return false;
    }
    if (!TrySwap(board_, move)) {
        RejectSwap(move);
        return false;
    }

    ++moves_;
    move_start_score_ = score_;

    ResolveOptions options = BaseResolveOptions();
    options.preferred = move.b;
    options.activation = ActivationForSwap(board_, move);
    resolver_.emplace(board_, std::move(options), trace_);

    TraceEvent event;
    event.kind = TraceKind::SwapAccepted;
    event.move = move;
    event.count = moves_;
    Emit(trace_, event);
    return true;
}

bool GameSession::StepMove() {
    if (!resolver_) {
        return false;
    }
    if (!resolver_->Step()) {
        FinishMove();
        return false;
    }

    const PassReport& report = resolver_->result().reports.back();
    score_ += report.points;
    best_score_ = std::max(best_score_, score_);
    if (listener_) {
        listener_(board_, report);
    }
    return true;
}

void GameSession::FinishMove() {
    const ResolveResult& result = resolver_->result();
    MoveOutcome outcome;
    outcome.accepted = true;
    outcome.points = score_ - move_start_score_;
    outcome.passes = result.passes;
    outcome.cleared = result.total_cleared;
    outcome.hit_pass_limit = result.hit_pass_limit;
    resolver_.reset();

    game_over_ = !AnyLegalMoves(board_);
    outcome.game_over = game_over_;
    last_outcome_ = outcome;

    if (game_over_) {
        TraceEvent event;
        event.kind = TraceKind::GameOver;
        event.points = score_;
        event.count = moves_;
        Emit(trace_, event);
    }
}

MoveOutcome GameSession::PlayMove(const Move& move) {
    if (!BeginMove(move)) {
        return MoveOutcome{};
    }
    while (StepMove()) {
    }
    return last_outcome_;
}

void GameSession::Reset() {
    Reset(ResolveSeed(config_));
}

void GameSession::Reset(std::uint32_t seed) {
    resolver_.reset();
    board_ = NewBoard(config_.boardRules(), seed);
    score_ = 0;
    moves_ = 0;
    move_start_score_ = 0;
    last_outcome_ = MoveOutcome{};
    game_over_ = !AnyLegalMoves(board_);
}

std::optional<ai::BestMoveResult> GameSession::Hint() const {
    if (resolving() || game_over_) {
        return std::nullopt;
    }
    return ai::BestMove(board_, BaseResolveOptions());
}

}  // namespace rockswap::core
