#pragma once
// AudioProbe.hpp - FFmpeg based audio file inspection
// Reads container/stream info without decoding the whole file

#include <filesystem>
#include <optional>
#include <string>
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace babel {

struct AudioInfo {
    std::optional<Duration> duration;
    std::string codec;
    u32 sampleRate{0};
    u32 channels{0};
    std::string title;
    std::string artist;
};

class AudioProbe {
public:
    static Result<AudioInfo> probe(const std::filesystem::path& path);
};

} // namespace babel
