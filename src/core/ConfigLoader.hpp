/**
 * @file ConfigLoader.hpp
 * @brief Configuration file I/O.
 *
 * Reads and writes the TOML configuration file. Writes go through a
 * temporary file so a crash never leaves a truncated config behind.
 */

#pragma once
#include <filesystem>
#include "util/Result.hpp"

namespace babel {

class Config;

class ConfigLoader {
public:
    static Result<void> load(Config& config, const std::filesystem::path& path);
    static Result<void> save(const Config& config,
                             const std::filesystem::path& path);
    static Result<void> loadDefault(Config& config);
};

} // namespace babel
