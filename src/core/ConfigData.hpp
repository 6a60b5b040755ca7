/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * Plain structs holding configuration values. Kept apart from the logic
 * classes so widgets can include them without pulling in toml++.
 */

#pragma once
#include <filesystem>
#include <string>
#include "util/Types.hpp"

namespace babel {

namespace fs = std::filesystem;

// Audio output
struct AudioConfig {
    std::string device{"default"};
    u32 bufferSize{2048};
    u32 sampleRate{44100};
    f32 volume{1.0f};
};

// Playback clock and position editing
struct PlayerConfig {
    u32 seekStepMs{100};
    u32 tickIntervalMs{16};
};

// Lyrics window and captions rendering
struct CaptionsConfig {
    std::string fontFamily{"Sans Serif"};
    u32 fontSize{24};
    bool bold{false};
    Color highlightColor{Color::fromHex("#F97316")};
    Color translationColor{Color::fromHex("#6B7280")};
    Color dimColor{Color::fromHex("#374151")};
    Color textColor{Color::fromHex("#E5E7EB")};
    Color backgroundColor{Color::fromHex("#111827")};
};

struct UIConfig {
    std::string theme{"dark"};
    bool showLyricsWindow{true};
    bool showCaptionsWindow{true};
    bool captionsAlwaysOnTop{true};
};

// Remembered dialog directories
struct PathsConfig {
    fs::path lastAudioDir;
    fs::path lastLyricsDir;
};

} // namespace babel
