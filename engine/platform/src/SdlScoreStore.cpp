#include "rockswap/platform/SdlScoreStore.hpp"

#include <SDL2/SDL.h>

#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

namespace rockswap::platform {

namespace {

std::filesystem::path DefaultScoreRoot() {
    std::filesystem::path base;
    if (char* pref = SDL_GetPrefPath("RockSwap", "Headless")) {
        base = pref;
        SDL_free(pref);
    }
    if (base.empty()) {
        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        if (ec) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Score store: no working directory (%s)",
                        ec.message().c_str());
            return std::filesystem::path("saves");
        }
        base = cwd / "saves";
    }
    return base;
}

}  // namespace

SdlScoreStore::SdlScoreStore(std::filesystem::path root)
    : root_(root.empty() ? DefaultScoreRoot() : std::move(root)) {
    record_path_ = root_ / "best.bin";
}

bool SdlScoreStore::Initialize() {
    return EnsureRootExists();
}

bool SdlScoreStore::EnsureRootExists() const {
    std::error_code ec;
    if (std::filesystem::exists(root_, ec)) {
        return true;
    }
    return std::filesystem::create_directories(root_, ec);
}

bool SdlScoreStore::Load(core::ScoreRecord& out) const {
    std::ifstream in(record_path_, std::ios::binary);
    if (!in) {
        return false;
    }
    in.seekg(0, std::ios::end);
    std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);
    if (size <= 0) {
        return false;
    }
    std::vector<std::uint8_t> bytes(static_cast<std::size_t>(size));
    in.read(reinterpret_cast<char*>(bytes.data()), size);
    if (!in.good()) {
        return false;
    }
    try {
        out = core::ScoreRecord::DeserializeBinary(bytes);
    } catch (const core::Json::exception& e) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Ignoring unreadable score record %s: %s",
                    record_path_.string().c_str(), e.what());
        return false;
    }
    return true;
}

bool SdlScoreStore::Save(const core::ScoreRecord& record) {
    if (!EnsureRootExists()) {
        return false;
    }
    const auto payload = record.SerializeBinary();
    std::ofstream out(record_path_, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out.write(reinterpret_cast<const char*>(payload.data()),
              static_cast<std::streamsize>(payload.size()));
    return out.good();
}

bool SdlScoreStore::Clear() {
    std::error_code ec;
    return std::filesystem::remove(record_path_, ec);
}

}  // namespace rockswap::platform
