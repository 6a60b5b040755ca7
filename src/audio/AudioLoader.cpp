#include "AudioLoader.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace babel {

Result<AudioDetails> AudioLoader::load(const std::filesystem::path& path) {
    auto bytes = file::readBytes(path);
    if (!bytes)
        return Result<AudioDetails>::err(bytes.error().message);

    AudioDetails details;
    details.path = path;
    details.fileName = path.filename().string();
    details.size = bytes->size();
    details.data = std::move(*bytes);

    // A failed probe only costs us the duration display
    if (auto info = AudioProbe::probe(path)) {
        details.info = *info;
        details.duration = info->duration;
    } else {
        LOG_WARN("Could not probe {}: {}", details.fileName, info.error().message);
    }

    return Result<AudioDetails>::ok(std::move(details));
}

bool AudioLoader::loadAsync(const std::filesystem::path& path) {
    return job_.start([this, path] {
        LOG_INFO("Loading audio file {}", path.string());
        auto result = load(path);
        if (!result) {
            LOG_ERROR("Failed to load audio: {}", result.error().message);
            failed.emitSignal(result.error().message);
            return;
        }
        loaded.emitSignal(std::make_shared<AudioDetails>(std::move(*result)));
    });
}

} // namespace babel
