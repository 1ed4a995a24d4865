#pragma once

#include <cstdint>

namespace rockswap::core {

enum class SpecialKind : std::uint8_t {
    None,
    AreaClear,
    Wildcard,
};

// Content of one board cell: Empty, Normal(color) or Special(color, kind).
// A Wildcard keeps its color for rendering only; matching never reads it.
class Tile {
public:
    constexpr Tile() noexcept = default;

    static constexpr Tile Empty() noexcept { return Tile{}; }

    static constexpr Tile Normal(int color) noexcept {
        if (color < 0) {
            return Tile{};
        }
        return Tile{static_cast<std::int16_t>(color), SpecialKind::None};
    }

    static constexpr Tile Special(int color, SpecialKind kind) noexcept {
        if (color < 0) {
            return Tile{};
        }
        return Tile{static_cast<std::int16_t>(color), kind};
    }

    constexpr bool empty() const noexcept { return color_ < 0; }
    constexpr bool isNormal() const noexcept { return !empty() && special_ == SpecialKind::None; }
    constexpr bool isSpecial() const noexcept { return !empty() && special_ != SpecialKind::None; }
    constexpr bool isAreaClear() const noexcept {
        return !empty() && special_ == SpecialKind::AreaClear;
    }
    constexpr bool isWildcard() const noexcept {
        return !empty() && special_ == SpecialKind::Wildcard;
    }

    // -1 for Empty.
    constexpr int color() const noexcept { return color_; }
    constexpr SpecialKind special() const noexcept { return special_; }

    constexpr Tile promoted(SpecialKind kind) const noexcept { return Special(color_, kind); }

    constexpr bool operator==(const Tile& other) const noexcept {
        return color_ == other.color_ && special_ == other.special_;
    }

    constexpr bool operator!=(const Tile& other) const noexcept { return !(*this == other); }

private:
    constexpr Tile(std::int16_t color, SpecialKind special) noexcept
        : color_(color), special_(special) {}

    std::int16_t color_ = -1;
    SpecialKind special_ = SpecialKind::None;
};

// Two tiles share a matchable color: both present, neither a Wildcard.
constexpr bool SameColor(const Tile& a, const Tile& b) noexcept {
    return !a.empty() && !b.empty() && !a.isWildcard() && !b.isWildcard() &&
           a.color() == b.color();
}

const char* ToString(SpecialKind kind) noexcept;

}  // namespace rockswap::core
