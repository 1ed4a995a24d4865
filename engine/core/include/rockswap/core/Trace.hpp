#pragma once

#include <functional>

#include "rockswap/core/Tile.hpp"
#include "rockswap/core/Types.hpp"

namespace rockswap::core {

enum class TraceKind {
    SwapRejected,
    SwapAccepted,
    PassResolved,
    SpecialCreated,
    AreaClearFired,
    ColorWipeFired,
    BoardWipeFired,
    BoardStable,
    PassLimitReached,
    GameOver,
};

struct TraceEvent {
    TraceKind kind = TraceKind::PassResolved;
    int pass = 0;
    int chain = 0;
    int points = 0;
    int cleared = 0;
    int count = 0;
    Move move{};
    Cell cell{};
    SpecialKind special = SpecialKind::None;
};

using TraceSink = std::function<void(const TraceEvent&)>;

const char* ToString(TraceKind kind) noexcept;

inline void Emit(const TraceSink& sink, const TraceEvent& event) {
    if (sink) {
        sink(event);
    }
}

}  // namespace rockswap::core
