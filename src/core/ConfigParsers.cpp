#include "ConfigParsers.hpp"
#include <algorithm>
#include <cstdlib>
#include "Logger.hpp"

namespace babel {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_same_v<T, f32>) {
            if (auto val = node.value<double>())
                return static_cast<f32>(*val);
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>()) {
                if constexpr (std::is_unsigned_v<T>) {
                    if (*val < 0)
                        return defaultVal;
                }
                return static_cast<T>(*val);
            }
        }
    }
    return defaultVal;
}

Color getColor(const toml::table& tbl, std::string_view key, Color defaultVal) {
    auto hex = get(tbl, key, std::string());
    if (hex.empty())
        return defaultVal;
    return Color::fromHex(hex);
}

fs::path expandPath(std::string_view path) {
    std::string p(path);
    if (p.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            p = std::string(home) + p.substr(1);
        }
    }
    return fs::path(p);
}
} // namespace

void ConfigParsers::parseAudio(const toml::table& tbl, AudioConfig& cfg) {
    if (auto audio = tbl["audio"].as_table()) {
        cfg.device = get(*audio, "device", std::string("default"));
        cfg.bufferSize =
                std::clamp(get(*audio, "buffer_size", 2048u), 256u, 16384u);
        cfg.sampleRate =
                std::clamp(get(*audio, "sample_rate", 44100u), 8000u, 192000u);
        cfg.volume = std::clamp(get(*audio, "volume", 1.0f), 0.0f, 1.0f);
    }
}

void ConfigParsers::parsePlayer(const toml::table& tbl, PlayerConfig& cfg) {
    if (auto player = tbl["player"].as_table()) {
        cfg.seekStepMs =
                std::clamp(get(*player, "seek_step_ms", 100u), 10u, 10000u);
        cfg.tickIntervalMs =
                std::clamp(get(*player, "tick_interval_ms", 16u), 5u, 100u);
    }
}

void ConfigParsers::parseCaptions(const toml::table& tbl, CaptionsConfig& cfg) {
    if (auto cap = tbl["captions"].as_table()) {
        cfg.fontFamily = get(*cap, "font_family", std::string("Sans Serif"));
        cfg.fontSize = std::clamp(get(*cap, "font_size", 24u), 8u, 144u);
        cfg.bold = get(*cap, "bold", false);
        cfg.highlightColor =
                getColor(*cap, "highlight_color", cfg.highlightColor);
        cfg.translationColor =
                getColor(*cap, "translation_color", cfg.translationColor);
        cfg.dimColor = getColor(*cap, "dim_color", cfg.dimColor);
        cfg.textColor = getColor(*cap, "text_color", cfg.textColor);
        cfg.backgroundColor =
                getColor(*cap, "background_color", cfg.backgroundColor);
    }
}

void ConfigParsers::parseUI(const toml::table& tbl, UIConfig& cfg) {
    if (auto uiTbl = tbl["ui"].as_table()) {
        cfg.theme = get(*uiTbl, "theme", std::string("dark"));
        if (cfg.theme != "dark" && cfg.theme != "light") {
            LOG_WARN("Unknown theme '{}', falling back to dark", cfg.theme);
            cfg.theme = "dark";
        }
        cfg.showLyricsWindow = get(*uiTbl, "show_lyrics_window", true);
        cfg.showCaptionsWindow = get(*uiTbl, "show_captions_window", true);
        cfg.captionsAlwaysOnTop = get(*uiTbl, "captions_always_on_top", true);
    }
}

void ConfigParsers::parsePaths(const toml::table& tbl, PathsConfig& cfg) {
    if (auto paths = tbl["paths"].as_table()) {
        auto audioDir = get(*paths, "last_audio_dir", std::string());
        if (!audioDir.empty())
            cfg.lastAudioDir = expandPath(audioDir);
        auto lyricsDir = get(*paths, "last_lyrics_dir", std::string());
        if (!lyricsDir.empty())
            cfg.lastLyricsDir = expandPath(lyricsDir);
    }
}

toml::table ConfigParsers::serialize(const AudioConfig& audio,
                                     const PlayerConfig& player,
                                     const CaptionsConfig& captions,
                                     const UIConfig& ui,
                                     const PathsConfig& paths,
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});
    root.insert("audio",
                toml::table{{"device", audio.device},
                            {"buffer_size", (i64)audio.bufferSize},
                            {"sample_rate", (i64)audio.sampleRate},
                            {"volume", (double)audio.volume}});

    root.insert("player",
                toml::table{{"seek_step_ms", (i64)player.seekStepMs},
                            {"tick_interval_ms", (i64)player.tickIntervalMs}});

    root.insert("captions",
                toml::table{
                        {"font_family", captions.fontFamily},
                        {"font_size", (i64)captions.fontSize},
                        {"bold", captions.bold},
                        {"highlight_color", captions.highlightColor.toHex()},
                        {"translation_color",
                         captions.translationColor.toHex()},
                        {"dim_color", captions.dimColor.toHex()},
                        {"text_color", captions.textColor.toHex()},
                        {"background_color",
                         captions.backgroundColor.toHex()}});

    root.insert("ui",
                toml::table{{"theme", ui.theme},
                            {"show_lyrics_window", ui.showLyricsWindow},
                            {"show_captions_window", ui.showCaptionsWindow},
                            {"captions_always_on_top",
                             ui.captionsAlwaysOnTop}});

    root.insert("paths",
                toml::table{{"last_audio_dir", paths.lastAudioDir.string()},
                            {"last_lyrics_dir", paths.lastLyricsDir.string()}});

    return root;
}

} // namespace babel
