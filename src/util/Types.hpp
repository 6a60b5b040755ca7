#pragma once
// Types.hpp - Common type aliases and small value types

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace babel {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;

// Playback and lyric times are whole milliseconds
using Duration = std::chrono::milliseconds;

struct Color {
    u8 r{0};
    u8 g{0};
    u8 b{0};
    u8 a{255};

    static constexpr Color white() {
        return {255, 255, 255, 255};
    }
    static constexpr Color black() {
        return {0, 0, 0, 255};
    }

    // Accepts #RGB, #RRGGBB and #RRGGBBAA. Anything else yields white.
    static Color fromHex(std::string_view hex);
    std::string toHex() const;

    bool operator==(const Color&) const = default;
};

} // namespace babel
