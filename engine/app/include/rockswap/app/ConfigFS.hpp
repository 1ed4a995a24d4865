#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "rockswap/core/GameConfig.hpp"

namespace rockswap::app {

bool FileExists(const std::filesystem::path& path);

const std::vector<std::filesystem::path>& ConfigRoots();

// First existing `filename` under the config roots, or `filename` as given.
std::filesystem::path ConfigPath(const std::string& filename);

// Reads and sanitizes a JSON config. Missing or malformed files fall back to
// defaults with a warning.
core::GameConfig LoadGameConfig(const std::filesystem::path& path);

}  // namespace rockswap::app
