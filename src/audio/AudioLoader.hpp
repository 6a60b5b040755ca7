#pragma once
// AudioLoader.hpp - Reads an audio file into memory off the UI thread

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "AudioProbe.hpp"
#include "util/BackgroundJob.hpp"
#include "util/Signal.hpp"

namespace babel {

struct AudioDetails {
    std::filesystem::path path;
    std::string fileName;
    u64 size{0};
    std::optional<Duration> duration;
    AudioInfo info;
    std::vector<u8> data;
};

class AudioLoader {
public:
    // Returns false if a load is already in progress
    bool loadAsync(const std::filesystem::path& path);

    // Synchronous variant used by loadAsync and the command line
    static Result<AudioDetails> load(const std::filesystem::path& path);

    bool isLoading() const {
        return job_.isBusy();
    }

    // Blocks until the current load has delivered its result
    void wait() {
        job_.join();
    }

    // Emitted from the worker thread
    Signal<std::shared_ptr<AudioDetails>> loaded;
    Signal<const std::string&> failed;

private:
    BackgroundJob job_;
};

} // namespace babel
