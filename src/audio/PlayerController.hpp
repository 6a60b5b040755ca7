#pragma once
// PlayerController.hpp - Player state machine
// Drives the PlaybackClock and keeps the AudioPlayer in step with it

#include <memory>
#include <optional>
#include "AudioLoader.hpp"
#include "AudioPlayer.hpp"
#include "PlaybackClock.hpp"
#include "util/Signal.hpp"

namespace babel {

class PlayerController {
public:
    explicit PlayerController(std::unique_ptr<AudioPlayer> player,
                              PlaybackClock::NowFn now = &PlaybackClock::Clock::now);
    ~PlayerController();

    // Hands a loaded file to the audio sink and stops the clock at 0
    Result<void> setTrack(std::shared_ptr<AudioDetails> details);
    const AudioDetails* track() const {
        return track_.get();
    }

    void play();
    void pause();
    void resume();
    void reset();
    void togglePlayPause();

    // User-edited position; re-seeks the sink while playing
    void seek(Duration position);

    // Called from the UI timer
    void tick();

    PlayerState state() const {
        return clock_.state();
    }
    Duration position() const {
        return clock_.timestamp();
    }
    std::optional<Duration> duration() const {
        return clock_.totalDuration();
    }
    bool audioAvailable() const {
        return player_ && player_->isInitialized();
    }

    Signal<Duration> positionChanged;
    Signal<PlayerState> stateChanged;
    Signal<const std::string&> errorOccurred;

private:
    void startSink();
    void setState(PlayerState previous);

    std::unique_ptr<AudioPlayer> player_;
    PlaybackClock clock_;
    std::shared_ptr<AudioDetails> track_;
};

} // namespace babel
