#include "rockswap/core/Trace.hpp"

namespace rockswap::core {

const char* ToString(TraceKind kind) noexcept {
    switch (kind) {
        case TraceKind::SwapRejected:
            return "swap-rejected";
        case TraceKind::SwapAccepted:
            return "swap-accepted";
        case TraceKind::PassResolved:
            return "pass-resolved";
        case TraceKind::SpecialCreated:
            return "special-created";
        case TraceKind::AreaClearFired:
            return "area-clear-fired";
        case TraceKind::ColorWipeFired:
            return "color-wipe-fired";
        case TraceKind::BoardWipeFired:
            return "board-wipe-fired";
        case TraceKind::BoardStable:
            return "board-stable";
        case TraceKind::PassLimitReached:
            return "pass-limit-reached";
        case TraceKind::GameOver:
            return "game-over";
    }
    return "unknown";
}

}  // namespace rockswap::core
