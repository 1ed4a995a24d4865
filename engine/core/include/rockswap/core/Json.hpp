#pragma once

#include <nlohmann/json.hpp>

namespace rockswap::core {

using Json = nlohmann::json;

}  // namespace rockswap::core
