#include "rockswap/core/Clear.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace rockswap::core {

namespace {

std::optional<CreatedSpecial> PlaceOnRun(const ColorRun& run, SpecialKind kind,
                                         const ClearMask& mask,
                                         const std::optional<Cell>& preferred) {
    if (preferred && run.contains(*preferred) && mask.test(*preferred)) {
        return CreatedSpecial{*preferred, kind};
    }
    const Cell mid = run.midpoint();
    if (mask.test(mid)) {
        return CreatedSpecial{mid, kind};
    }
    return std::nullopt;
}

void CollectAlong(const Board& board, const ClearMask& mask, const Cell& origin, int dcol,
                  int drow, std::vector<int>& colors) {
    Cell cursor{origin.col + dcol, origin.row + drow};
    while (mask.test(cursor)) {
        const Tile tile = board.get(cursor);
        if (tile.empty()) {
            break;
        }
        if (!tile.isWildcard() &&
            std::find(colors.begin(), colors.end(), tile.color()) == colors.end()) {
            colors.push_back(tile.color());
        }
        cursor = Cell{cursor.col + dcol, cursor.row + drow};
    }
}

}  // namespace

std::optional<CreatedSpecial> PickSpecial(const Board& board, const ClearMask& mask,
                                          const std::optional<Cell>& preferred) {
    const auto runs = FindColorRuns(board);
    if (runs.empty()) {
        return std::nullopt;
    }

    for (const auto& run : runs) {
        if (run.length < 5) {
            continue;
        }
        if (auto placed = PlaceOnRun(run, SpecialKind::Wildcard, mask, preferred)) {
            return placed;
        }
    }

    for (const auto& run : runs) {
        if (run.length != 4) {
            continue;
        }
        if (auto placed = PlaceOnRun(run, SpecialKind::AreaClear, mask, preferred)) {
            return placed;
        }
    }

    for (const auto& across : runs) {
        if (across.axis != ColorRun::Axis::Horizontal) {
            continue;
        }
        for (const auto& down : runs) {
            if (down.axis != ColorRun::Axis::Vertical || down.color != across.color) {
                continue;
            }
            const Cell crossing{down.start.col, across.start.row};
            if (across.contains(crossing) && down.contains(crossing) && mask.test(crossing)) {
                return CreatedSpecial{crossing, SpecialKind::AreaClear};
            }
        }
    }

    return std::nullopt;
}

std::vector<int> WildcardPartnerColors(const Board& board, const ClearMask& mask,
                                       const Cell& cell) {
    std::vector<int> colors;
    CollectAlong(board, mask, cell, -1, 0, colors);
    CollectAlong(board, mask, cell, 1, 0, colors);
    CollectAlong(board, mask, cell, 0, -1, colors);
    CollectAlong(board, mask, cell, 0, 1, colors);
    return colors;
}

int ClearAndScore(Board& board, const ClearMask& matched, const ClearOptions& options,
                  ClearOutcome* outcome) {
    if (!matched.any() || matched.cols() != board.cols() || matched.rows() != board.rows()) {
        return 0;
    }

    ClearMask mask = matched;

    std::optional<CreatedSpecial> created;
    if (options.allow_special) {
        created = PickSpecial(board, mask, options.preferred);
    }
    if (created) {
        const Tile base = board.get(created->position);
        if (base.empty()) {
            created.reset();
        } else {
            mask.set(created->position, false);
            board.set(created->position, base.promoted(created->kind));
        }
    }

    auto protected_cell = [&](const Cell& cell) {
        return created && created->position == cell;
    };

    // Consumed specials fire once each; anything they pull in may fire too.
    // A Wildcard's partner colors are read from the mask as it stood when the
    // Wildcard was caught, before other specials widen it.
    struct PendingSpecial {
        Cell cell;
        std::vector<int> partners;
    };
    auto pending_for = [&](const Cell& cell) {
        PendingSpecial entry{cell, {}};
        if (board.get(cell).isWildcard()) {
            entry.partners = WildcardPartnerColors(board, mask, cell);
        }
        return entry;
    };

    int area_clears = 0;
    int color_wipes = 0;
    std::vector<PendingSpecial> pending;
    for (const auto& cell : mask.cells()) {
        if (board.get(cell).isSpecial()) {
            pending.push_back(pending_for(cell));
        }
    }
    std::set<Cell> fired;

    auto mark = [&](const Cell& cell) {
        if (!board.inBounds(cell) || protected_cell(cell) || mask.test(cell)) {
            return;
        }
        mask.set(cell);
        if (board.get(cell).isSpecial()) {
            pending.push_back(pending_for(cell));
        }
    };

    while (!pending.empty()) {
        const PendingSpecial special = std::move(pending.back());
        pending.pop_back();
        const Cell& cell = special.cell;
        if (!fired.insert(cell).second) {
            continue;
        }
        const Tile tile = board.get(cell);
        if (tile.isAreaClear()) {
            ++area_clears;
            for (int dcol = -1; dcol <= 1; ++dcol) {
                for (int drow = -1; drow <= 1; ++drow) {
                    mark(Cell{cell.col + dcol, cell.row + drow});
                }
            }
        } else if (tile.isWildcard()) {
            ++color_wipes;
            const auto& colors = special.partners;
            if (colors.empty()) {
                continue;
            }
            for (int col = 0; col < board.cols(); ++col) {
                for (int row = 0; row < board.rows(); ++row) {
                    const Tile other = board.get(col, row);
                    if (other.empty() || other.isWildcard()) {
                        continue;
                    }
                    if (std::find(colors.begin(), colors.end(), other.color()) != colors.end()) {
                        mark(Cell{col, row});
                    }
                }
            }
        }
    }

    std::vector<ClearedTile> cleared;
    for (const auto& cell : mask.cells()) {
        const Tile tile = board.get(cell);
        if (tile.empty()) {
            continue;
        }
        cleared.push_back(ClearedTile{cell, tile});
        board.set(cell, Tile::Empty());
    }

    const int points = static_cast<int>(cleared.size()) * options.points_per_tile;

    if (outcome != nullptr) {
        outcome->cleared = std::move(cleared);
        outcome->created = created;
        outcome->area_clears = area_clears;
        outcome->color_wipes = color_wipes;
        outcome->mask = std::move(mask);
    }
    return points;
}

int ClearAndScore(Board& board, const std::vector<Cell>& matched, const ClearOptions& options,
                  ClearOutcome* outcome) {
    return ClearAndScore(board, ClearMask::FromCells(board, matched), options, outcome);
}

}  // namespace rockswap::core
