#include "rockswap/app/ConfigFS.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <sstream>

namespace rockswap::app {

namespace {

void PushIfExists(std::vector<std::filesystem::path>& roots, const std::filesystem::path& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return;
    }
    if (std::find(roots.begin(), roots.end(), path) == roots.end()) {
        roots.push_back(path);
    }
}

void HarvestConfigDirs(std::vector<std::filesystem::path>& roots,
                       const std::filesystem::path& start,
                       int max_depth) {
    std::filesystem::path cursor = start;
    for (int depth = 0; depth < max_depth && !cursor.empty(); ++depth) {
        PushIfExists(roots, cursor / "config");
        if (cursor == cursor.parent_path()) {
            break;
        }
        cursor = cursor.parent_path();
    }
}

}  // namespace

bool FileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

const std::vector<std::filesystem::path>& ConfigRoots() {
    static std::vector<std::filesystem::path> roots;
    static std::once_flag init_flag;
    std::call_once(init_flag, [] {
        if (const char* env = std::getenv("ROCKSWAP_CONFIG_DIR")) {
            PushIfExists(roots, std::filesystem::path(env));
        }

        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        if (!ec) {
            HarvestConfigDirs(roots, cwd, 4);
        }

        if (char* raw_base = SDL_GetBasePath()) {
            std::filesystem::path base_path(raw_base);
            SDL_free(raw_base);
            HarvestConfigDirs(roots, base_path, 4);
        }

        if (!ec) {
            PushIfExists(roots, cwd);
        }
    });
    return roots;
}

std::filesystem::path ConfigPath(const std::string& filename) {
    for (const auto& root : ConfigRoots()) {
        std::filesystem::path candidate = root / filename;
        if (FileExists(candidate)) {
            return candidate;
        }
    }
    return std::filesystem::path(filename);
}

core::GameConfig LoadGameConfig(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "No config at %s, using defaults",
                    path.string().c_str());
        return core::GameConfig{}.Sanitized();
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    try {
        return core::GameConfig::Deserialize(buffer.str()).Sanitized();
    } catch (const core::Json::exception& e) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Bad config %s: %s", path.string().c_str(),
                    e.what());
    }
    return core::GameConfig{}.Sanitized();
}

}  // namespace rockswap::app
