#include "ConfigLoader.hpp"
#include <sstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace babel {

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());

        if (auto gen = tbl["general"].as_table()) {
            config.setDebug((*gen)["debug"].value_or(false));
        }

        ConfigParsers::parseAudio(tbl, config.audio());
        ConfigParsers::parsePlayer(tbl, config.player());
        ConfigParsers::parseCaptions(tbl, config.captions());
        ConfigParsers::parseUI(tbl, config.ui());
        ConfigParsers::parsePaths(tbl, config.paths());

        config.markClean();
        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(std::string("Config parse error: ") +
                                 std::string(err.description()) + " at line " +
                                 std::to_string(err.source().begin.line));
    }
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    auto configDir = file::configDir();
    auto defaultPath = configDir / "config.toml";
    config.configPath_ = defaultPath;

    if (fs::exists(defaultPath)) {
        return load(config, defaultPath);
    }

    LOG_WARN("No config file found, writing built-in defaults to {}",
             defaultPath.string());
    if (!file::ensureDir(configDir)) {
        return Result<void>::err("Failed to create config directory: " +
                                 configDir.string());
    }
    return save(config, defaultPath);
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    auto tbl = ConfigParsers::serialize(config.audio(),
                                        config.player(),
                                        config.captions(),
                                        config.ui(),
                                        config.paths(),
                                        config.debug());
    std::ostringstream out;
    out << tbl << "\n";

    if (auto res = file::writeAtomic(path, out.str()); !res) {
        LOG_ERROR("Failed to save config: {}", res.error().message);
        return Result<void>::err("Failed to save config: " +
                                 res.error().message);
    }
    LOG_DEBUG("Config saved to: {}", path.string());
    return Result<void>::ok();
}

} // namespace babel
