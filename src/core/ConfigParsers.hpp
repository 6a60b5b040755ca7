/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * Converts between toml++ tables and the configuration structs. Missing keys
 * keep their defaults, out-of-range values are clamped.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace babel {

class ConfigParsers {
public:
    static void parseAudio(const toml::table& tbl, AudioConfig& cfg);
    static void parsePlayer(const toml::table& tbl, PlayerConfig& cfg);
    static void parseCaptions(const toml::table& tbl, CaptionsConfig& cfg);
    static void parseUI(const toml::table& tbl, UIConfig& cfg);
    static void parsePaths(const toml::table& tbl, PathsConfig& cfg);

    static toml::table serialize(const AudioConfig& audio,
                                 const PlayerConfig& player,
                                 const CaptionsConfig& captions,
                                 const UIConfig& ui,
                                 const PathsConfig& paths,
                                 bool debug);
};

} // namespace babel
