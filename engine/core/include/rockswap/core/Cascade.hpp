#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "rockswap/core/Board.hpp"
#include "rockswap/core/Clear.hpp"
#include "rockswap/core/Gravity.hpp"
#include "rockswap/core/Runs.hpp"
#include "rockswap/core/Trace.hpp"

namespace rockswap::core {

inline constexpr int kDefaultMaxPasses = 80;

// A committed swap that moved a Wildcard: fires on the first pass instead of a scan.
struct WildcardActivation {
    Cell wildcard{};
    Cell partner{};
    bool board_wipe = false;
};

// Reads the post-swap board; nullopt when neither swapped cell holds a Wildcard.
std::optional<WildcardActivation> ActivationForSwap(const Board& board, const Move& move);

// Wildcard cell plus every real tile of the partner's color, or the whole
// board when both swapped tiles are Wildcards.
ClearMask ActivationMask(const Board& board, const WildcardActivation& activation);

struct ResolveOptions {
    std::optional<Cell> preferred;
    std::optional<WildcardActivation> activation;
    int points_per_tile = kPointsPerTile;
    int max_passes = kDefaultMaxPasses;
};

struct PassReport {
    int pass = 0;
    int chain = 0;
    int base_points = 0;
    int points = 0;
    // Cells matched at the start of the pass, before special expansion.
    ClearMask matched;
    std::vector<ClearedTile> cleared;
    std::optional<CreatedSpecial> created;
    bool via_activation = false;
    bool board_wipe = false;
    int area_clears = 0;
    int color_wipes = 0;
    std::vector<FallEvent> falls;
    std::vector<SpawnEvent> spawns;
};

struct ResolveResult {
    int score = 0;
    int passes = 0;
    int total_cleared = 0;
    bool hit_pass_limit = false;
    std::vector<PassReport> reports;
};

// Called after every pass with the post-refill board.
using PassListener = std::function<void(const Board&, const PassReport&)>;

// Runs one move's cascade a pass at a time over a board it does not own.
class CascadeResolver {
public:
    CascadeResolver(Board& board, ResolveOptions options, TraceSink trace = {});

    // Runs one scan, clear, collapse and refill pass. Returns false, doing
    // nothing, once the board is stable or the pass ceiling is reached.
    bool Step();

    bool finished() const noexcept { return finished_; }
    int chain() const noexcept { return chain_; }
    const ResolveResult& result() const noexcept { return result_; }

private:
    Board& board_;
    ResolveOptions options_;
    TraceSink trace_;
    std::optional<WildcardActivation> pending_;
    ResolveResult result_{};
    int chain_ = 1;
    bool finished_ = false;
};

ResolveResult ResolveBoard(Board& board, const ResolveOptions& options,
                           const TraceSink& trace = {}, const PassListener& listener = {});

}  // namespace rockswap::core
