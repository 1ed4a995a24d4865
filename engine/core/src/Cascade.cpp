#include "rockswap/core/Cascade.hpp"

#include <utility>

namespace rockswap::core {

std::optional<WildcardActivation> ActivationForSwap(const Board& board, const Move& move) {
    const bool a_wild = board.get(move.a).isWildcard();
    const bool b_wild = board.get(move.b).isWildcard();
    if (a_wild && b_wild) {
        return WildcardActivation{move.a, move.b, true};
    }
    if (a_wild) {
        return WildcardActivation{move.a, move.b, false};
    }
    if (b_wild) {
        return WildcardActivation{move.b, move.a, false};
    }
    return std::nullopt;
}

ClearMask ActivationMask(const Board& board, const WildcardActivation& activation) {
    if (activation.board_wipe) {
        return ClearMask::Full(board);
    }
    ClearMask mask(board);
    const Tile partner = board.get(activation.partner);
    if (!board.get(activation.wildcard).isWildcard() || partner.empty() ||
        partner.isWildcard()) {
        return mask;
    }
    mask.set(activation.wildcard);
    for (int col = 0; col < board.cols(); ++col) {
        for (int row = 0; row < board.rows(); ++row) {
            if (SameColor(board.get(col, row), partner)) {
                mask.set(Cell{col, row});
            }
        }
    }
    return mask;
}

CascadeResolver::CascadeResolver(Board& board, ResolveOptions options, TraceSink trace)
    : board_(board),
      options_(std::move(options)),
      trace_(std::move(trace)),
      pending_(options_.activation) {}

bool CascadeResolver::Step() {
    if (finished_) {
        return false;
    }

    ClearMask matched;
    const bool via_activation = pending_.has_value();
    const bool board_wipe = via_activation && pending_->board_wipe;
    if (via_activation) {
        matched = ActivationMask(board_, *pending_);
        pending_.reset();
    } else {
        matched = ScanRuns(board_);
    }

    if (!matched.any()) {
        finished_ = true;
        TraceEvent event;
        event.kind = TraceKind::BoardStable;
        event.pass = result_.passes;
        event.points = result_.score;
        Emit(trace_, event);
        return false;
    }

    if (result_.passes >= options_.max_passes) {
        finished_ = true;
        result_.hit_pass_limit = true;
        TraceEvent event;
        event.kind = TraceKind::PassLimitReached;
        event.pass = result_.passes;
        event.points = result_.score;
        Emit(trace_, event);
        return false;
    }

    PassReport report;
    report.pass = result_.passes + 1;
    report.chain = chain_;
    report.via_activation = via_activation;
    report.board_wipe = board_wipe;

    ClearOptions clear;
    if (report.pass == 1) {
        clear.preferred = options_.preferred;
    }
    clear.points_per_tile = options_.points_per_tile;
    clear.allow_special = !via_activation;

    ClearOutcome outcome;
    report.base_points = ClearAndScore(board_, matched, clear, &outcome);
    report.points = report.base_points * chain_;
    report.matched = std::move(matched);
    report.cleared = std::move(outcome.cleared);
    report.created = outcome.created;
    report.area_clears = outcome.area_clears;
    report.color_wipes = outcome.color_wipes;

    if (board_wipe) {
        TraceEvent event;
        event.kind = TraceKind::BoardWipeFired;
        event.pass = report.pass;
        event.cleared = static_cast<int>(report.cleared.size());
        Emit(trace_, event);
    }
    if (report.created) {
        TraceEvent event;
        event.kind = TraceKind::SpecialCreated;
        event.pass = report.pass;
        event.cell = report.created->position;
        event.special = report.created->kind;
        Emit(trace_, event);
    }
    if (report.area_clears > 0) {
        TraceEvent event;
        event.kind = TraceKind::AreaClearFired;
        event.pass = report.pass;
        event.count = report.area_clears;
        Emit(trace_, event);
    }
    if (report.color_wipes > 0) {
        TraceEvent event;
        event.kind = TraceKind::ColorWipeFired;
        event.pass = report.pass;
        event.count = report.color_wipes;
        Emit(trace_, event);
    }

    report.falls = Collapse(board_);
    report.spawns = Refill(board_);

    result_.score += report.points;
    result_.total_cleared += static_cast<int>(report.cleared.size());
    result_.passes = report.pass;

    TraceEvent event;
    event.kind = TraceKind::PassResolved;
    event.pass = report.pass;
    event.chain = report.chain;
    event.points = report.points;
    event.cleared = static_cast<int>(report.cleared.size());
    Emit(trace_, event);

    result_.reports.push_back(std::move(report));
    ++chain_;
    return true;
}

ResolveResult ResolveBoard(Board& board, const ResolveOptions& options, const TraceSink& trace,
                           const PassListener& listener) {
    CascadeResolver resolver(board, options, trace);
    while (resolver.Step()) {
        if (listener) {
            listener(board, resolver.result().reports.back());
        }
    }
    return resolver.result();
}

}  // namespace rockswap::core
