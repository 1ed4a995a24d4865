#define SDL_MAIN_HANDLED

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>

#include <SDL2/SDL.h>
#include <SDL2/SDL_main.h>

#include "rockswap/app/ConfigFS.hpp"
#include "rockswap/core/ScoreRecord.hpp"
#include "rockswap/core/Session.hpp"
#include "rockswap/platform/SdlScoreStore.hpp"
#include "rockswap/platform/SdlTraceLogger.hpp"

using rockswap::app::ConfigPath;
using rockswap::app::LoadGameConfig;
using rockswap::core::GameConfig;
using rockswap::core::GameSession;
using rockswap::core::ScoreRecord;
using rockswap::platform::SdlScoreStore;
using rockswap::platform::SdlTraceLogger;

namespace {

constexpr const char* kDefaultConfigName = "rockswap.json";

struct Options {
    std::string config_path;
    std::optional<std::uint32_t> seed;
    std::optional<int> move_limit;
    bool verbose = false;
    bool reset_best = false;
};

bool ParseInt(const char* text, long long& out) {
    if (text == nullptr || *text == '\0') {
        return false;
    }
    char* end = nullptr;
    out = std::strtoll(text, &end, 10);
    return end != nullptr && *end == '\0';
}

void PrintUsage(const char* argv0) {
    SDL_Log("usage: %s [--config FILE] [--seed N] [--moves N] [--verbose] [--reset-best]",
            argv0);
}

std::optional<Options> ParseArgs(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* value = (i + 1 < argc) ? argv[i + 1] : nullptr;
        long long number = 0;
        if (std::strcmp(arg, "--config") == 0 && value != nullptr) {
            options.config_path = value;
            ++i;
        } else if (std::strcmp(arg, "--seed") == 0 && ParseInt(value, number) && number >= 0) {
            options.seed = static_cast<std::uint32_t>(number);
            ++i;
        } else if (std::strcmp(arg, "--moves") == 0 && ParseInt(value, number) && number >= 0) {
            options.move_limit = static_cast<int>(number);
            ++i;
        } else if (std::strcmp(arg, "--verbose") == 0) {
            options.verbose = true;
        } else if (std::strcmp(arg, "--reset-best") == 0) {
            options.reset_best = true;
        } else {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown or incomplete argument: %s", arg);
            return std::nullopt;
        }
    }
    return options;
}

}  // namespace

int main(int argc, char* argv[]) {
    SDL_SetMainReady();
    if (SDL_Init(0) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return 1;
    }

    auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage(argv[0]);
        SDL_Quit();
        return 2;
    }
    SDL_LogSetPriority(SDL_LOG_CATEGORY_APPLICATION,
                       options->verbose ? SDL_LOG_PRIORITY_DEBUG : SDL_LOG_PRIORITY_INFO);

    const auto config_path = options->config_path.empty() ? ConfigPath(kDefaultConfigName)
                                                          : std::filesystem::path(
                                                                options->config_path);
    GameConfig config = LoadGameConfig(config_path);
    if (options->seed) {
        config.seed = options->seed;
    }
    if (options->move_limit) {
        config.move_limit = *options->move_limit;
    }

    SdlScoreStore store;
    if (!store.Initialize()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Score directory unavailable: %s",
                    store.root().string().c_str());
    }
    if (options->reset_best && !store.Clear()) {
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "No stored best score to reset");
    }
    ScoreRecord record;
    if (!store.Load(record)) {
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Starting without a stored best score");
    }

    SdlTraceLogger logger(options->verbose);
    GameSession session(config);
    session.setBestScore(record.best_score);
    session.setTraceSink(logger.sink());
    session.setPassListener(logger.passListener());

    SDL_Log("RockSwap headless: %dx%d board, %d colors", session.board().cols(),
            session.board().rows(), session.board().tileTypes());

    const int move_limit = session.config().move_limit;
    while (!session.gameOver() && (move_limit == 0 || session.moves() < move_limit)) {
        auto hint = session.Hint();
        if (!hint) {
            break;
        }
        const auto outcome = session.PlayMove(hint->move);
        if (!outcome.accepted) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Hinted move (%d,%d)-(%d,%d) was rejected",
                        hint->move.a.col, hint->move.a.row, hint->move.b.col, hint->move.b.row);
            break;
        }
    }

    const bool new_best = record.Submit(session.score());
    if (!store.Save(record)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to write score record to %s",
                    store.recordPath().string().c_str());
    }

    SDL_Log("Final score %d after %d moves (best %d%s)%s", session.score(), session.moves(),
            record.best_score, new_best ? ", new" : "", session.gameOver() ? ", no moves left" : "");

    SDL_Quit();
    return 0;
}
