#include "rockswap/core/Tile.hpp"

namespace rockswap::core {

const char* ToString(SpecialKind kind) noexcept {
    switch (kind) {
        case SpecialKind::None:
            return "none";
        case SpecialKind::AreaClear:
            return "area-clear";
        case SpecialKind::Wildcard:
            return "wildcard";
    }
    return "unknown";
}

}  // namespace rockswap::core
