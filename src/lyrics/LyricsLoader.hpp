#pragma once
// LyricsLoader.hpp - Loads lyrics JSON or imports TTML off the UI thread

#include <filesystem>
#include <memory>
#include <string>
#include "LyricsData.hpp"
#include "util/BackgroundJob.hpp"
#include "util/Result.hpp"
#include "util/Signal.hpp"

namespace babel::lyrics {

enum class LyricsFormat { BabelJson, AmllTtml };

class LyricsLoader {
public:
    // Returns false if a load is already in progress
    bool loadAsync(const std::filesystem::path& path, LyricsFormat format);

    static Result<BabelLyrics> load(const std::filesystem::path& path,
                                    LyricsFormat format);

    bool isLoading() const {
        return job_.isBusy();
    }

    // Blocks until the current load has delivered its result
    void wait() {
        job_.join();
    }

    // Emitted from the worker thread: file picked and readable, then data
    Signal<const std::filesystem::path&, const std::string&> fileSelected;
    Signal<std::shared_ptr<BabelLyrics>> loaded;
    Signal<const std::string&> failed;

private:
    BackgroundJob job_;
};

} // namespace babel::lyrics
