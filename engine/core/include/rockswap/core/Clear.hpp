#pragma once

#include <optional>
#include <vector>

#include "rockswap/core/Board.hpp"
#include "rockswap/core/Runs.hpp"

namespace rockswap::core {

inline constexpr int kPointsPerTile = 10;

struct ClearOptions {
    // Destination of the player's swap; wins special placement when it sits in the run.
    std::optional<Cell> preferred;
    int points_per_tile = kPointsPerTile;
    bool allow_special = true;
};

struct ClearedTile {
    Cell position{};
    Tile tile{};
};

struct CreatedSpecial {
    Cell position{};
    SpecialKind kind = SpecialKind::None;
};

struct ClearOutcome {
    std::vector<ClearedTile> cleared;
    std::optional<CreatedSpecial> created;
    int area_clears = 0;
    int color_wipes = 0;
    // Final mask after special placement and expansion.
    ClearMask mask;
};

// Picks the single special tile a pass may create, or nullopt. Priority:
// 5+ run (Wildcard), exact 4 run (AreaClear), then an L/T crossing of two
// runs of one color (AreaClear at the crossing).
std::optional<CreatedSpecial> PickSpecial(const Board& board, const ClearMask& mask,
                                          const std::optional<Cell>& preferred);

// Colors a consumed Wildcard at `cell` wipes: the real colors of the masked
// cells contiguous with it along its row and column.
std::vector<int> WildcardPartnerColors(const Board& board, const ClearMask& mask,
                                       const Cell& cell);

// Clears `matched` (plus whatever consumed specials pull in), creating at most
// one special tile, and returns cleared tiles times points_per_tile.
int ClearAndScore(Board& board, const ClearMask& matched, const ClearOptions& options = {},
                  ClearOutcome* outcome = nullptr);

int ClearAndScore(Board& board, const std::vector<Cell>& matched,
                  const ClearOptions& options = {}, ClearOutcome* outcome = nullptr);

}  // namespace rockswap::core
