#include "LyricsLoader.hpp"
#include "LyricsJson.hpp"
#include "TtmlImporter.hpp"
#include "core/Logger.hpp"

namespace babel::lyrics {

Result<BabelLyrics> LyricsLoader::load(const std::filesystem::path& path,
                                       LyricsFormat format) {
    switch (format) {
    case LyricsFormat::BabelJson:
        return LyricsJson::loadFile(path);
    case LyricsFormat::AmllTtml:
        return TtmlImporter::loadFile(path);
    }
    return Result<BabelLyrics>::err("Unknown lyrics format");
}

bool LyricsLoader::loadAsync(const std::filesystem::path& path,
                             LyricsFormat format) {
    return job_.start([this, path, format] {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            auto msg = "Failed to open file: " + path.string();
            LOG_ERROR("{}", msg);
            failed.emitSignal(msg);
            return;
        }
        fileSelected.emitSignal(path, path.filename().string());

        auto result = load(path, format);
        if (!result) {
            failed.emitSignal(result.error().message);
            return;
        }
        loaded.emitSignal(std::make_shared<BabelLyrics>(std::move(*result)));
    });
}

} // namespace babel::lyrics
