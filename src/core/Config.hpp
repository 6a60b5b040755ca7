/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * Global access to application settings. Parsing is delegated to
 * ConfigParsers and file I/O to ConfigLoader. Mutable accessors mark the
 * configuration dirty so the main window knows to write it back on exit.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 */

#pragma once
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace babel {

class Config {
public:
    static Config& instance();

    Result<void> load(const fs::path& path);
    Result<void> save(const fs::path& path) const;
    Result<void> loadDefault();

    // Restores built-in defaults without touching the file on disk
    void resetToDefaults();

    fs::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
        markDirty();
    }

    const AudioConfig& audio() const {
        return audio_;
    }
    const PlayerConfig& player() const {
        return player_;
    }
    const CaptionsConfig& captions() const {
        return captions_;
    }
    const UIConfig& ui() const {
        return ui_;
    }
    const PathsConfig& paths() const {
        return paths_;
    }

    AudioConfig& audio() {
        markDirty();
        return audio_;
    }
    PlayerConfig& player() {
        markDirty();
        return player_;
    }
    CaptionsConfig& captions() {
        markDirty();
        return captions_;
    }
    UIConfig& ui() {
        markDirty();
        return ui_;
    }
    PathsConfig& paths() {
        markDirty();
        return paths_;
    }

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    Config() = default;
    void markDirty() {
        dirty_ = true;
    }

    fs::path configPath_;
    bool dirty_{false};
    bool debug_{false};

    AudioConfig audio_;
    PlayerConfig player_;
    CaptionsConfig captions_;
    UIConfig ui_;
    PathsConfig paths_;

    mutable std::mutex mutex_;
};

#define CONFIG babel::Config::instance()

} // namespace babel
