#include "rockswap/platform/SdlTraceLogger.hpp"

#include <SDL2/SDL.h>

namespace rockswap::platform {

using core::TraceKind;

void SdlTraceLogger::Log(const core::TraceEvent& event) const {
    switch (event.kind) {
        case TraceKind::SwapRejected:
            if (verbose_) {
                SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "swap (%d,%d)-(%d,%d) rejected",
                             event.move.a.col, event.move.a.row, event.move.b.col,
                             event.move.b.row);
            }
            break;
        case TraceKind::SwapAccepted:
            SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "move %d: swap (%d,%d)-(%d,%d)",
                        event.count, event.move.a.col, event.move.a.row, event.move.b.col,
                        event.move.b.row);
            break;
        case TraceKind::PassResolved:
            SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "pass %d: cleared=%d chain=x%d gained=%d",
                        event.pass, event.cleared, event.chain, event.points);
            break;
        case TraceKind::SpecialCreated:
            SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "pass %d: %s created at (%d,%d)",
                        event.pass, core::ToString(event.special), event.cell.col,
                        event.cell.row);
            break;
        case TraceKind::AreaClearFired:
        case TraceKind::ColorWipeFired:
        case TraceKind::BoardWipeFired:
            SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "pass %d: %s (count=%d cleared=%d)",
                        event.pass, core::ToString(event.kind), event.count, event.cleared);
            break;
        case TraceKind::BoardStable:
            if (verbose_) {
                SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "board stable after %d passes",
                             event.pass);
            }
            break;
        case TraceKind::PassLimitReached:
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "cascade stopped at pass ceiling (%d passes, %d points)", event.pass,
                        event.points);
            break;
        case TraceKind::GameOver:
            SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "game over: score=%d moves=%d",
                        event.points, event.count);
            break;
    }
}

void SdlTraceLogger::LogPass(const core::Board& board, const core::PassReport& report) const {
    if (!verbose_) {
        return;
    }
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION,
                 "pass %d board: %d tiles, %d fell, %d spawned, matched=%d", report.pass,
                 board.countNonEmpty(), static_cast<int>(report.falls.size()),
                 static_cast<int>(report.spawns.size()), report.matched.count());
}

core::TraceSink SdlTraceLogger::sink() const {
    return [logger = *this](const core::TraceEvent& event) { logger.Log(event); };
}

core::PassListener SdlTraceLogger::passListener() const {
    return [logger = *this](const core::Board& board, const core::PassReport& report) {
        logger.LogPass(board, report);
    };
}

}  // namespace rockswap::platform
