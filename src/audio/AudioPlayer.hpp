#pragma once
// AudioPlayer.hpp - SDL_mixer based playback sink
// Plays a whole file held in memory; position is driven by the caller

#include <atomic>
#include <string>
#include <vector>
#include "core/ConfigData.hpp"
#include "util/Result.hpp"
#include "util/Types.hpp"

struct _Mix_Music;
typedef struct _Mix_Music Mix_Music;

namespace babel {

class AudioPlayer {
public:
    AudioPlayer();
    ~AudioPlayer();

    AudioPlayer(const AudioPlayer&) = delete;
    AudioPlayer& operator=(const AudioPlayer&) = delete;

    Result<void> init(const AudioConfig& cfg);
    void shutdown();

    // Replaces the current track; the new one is left paused at 0
    Result<void> load(std::vector<u8> data, const std::string& name);
    void unload();

    Result<void> playFrom(Duration position);
    void pause();
    // Pause and seek back to the beginning
    void rewind();
    void setVolume(f32 volume); // 0.0 - 1.0

    bool isInitialized() const {
        return initialized_;
    }
    bool hasTrack() const {
        return music_ != nullptr;
    }
    bool isPlaying() const;

    // Set from the SDL audio thread when a track runs out
    bool consumeFinished() {
        return finished_.exchange(false);
    }

private:
    static void onMusicFinished();

    Mix_Music* music_{nullptr};
    std::vector<u8> data_; // must outlive music_
    std::string name_;
    bool initialized_{false};
    bool started_{false};

    static std::atomic<bool> finished_;
};

} // namespace babel
