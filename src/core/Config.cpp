#include "Config.hpp"
#include "ConfigLoader.hpp"

namespace babel {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result<void> Config::load(const fs::path& path) {
    std::lock_guard lock(mutex_);
    configPath_ = path;
    return ConfigLoader::load(*this, path);
}

Result<void> Config::loadDefault() {
    std::lock_guard lock(mutex_);
    return ConfigLoader::loadDefault(*this);
}

Result<void> Config::save(const fs::path& path) const {
    std::lock_guard lock(mutex_);
    return ConfigLoader::save(*this, path);
}

void Config::resetToDefaults() {
    std::lock_guard lock(mutex_);
    debug_ = false;
    audio_ = AudioConfig{};
    player_ = PlayerConfig{};
    captions_ = CaptionsConfig{};
    ui_ = UIConfig{};
    paths_ = PathsConfig{};
    dirty_ = false;
}

} // namespace babel
