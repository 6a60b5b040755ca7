#include "PlaybackClock.hpp"
#include <algorithm>
#include <limits>

namespace babel {

const char* toString(PlayerState state) {
    switch (state) {
    case PlayerState::Stopped:
        return "stopped";
    case PlayerState::Playing:
        return "playing";
    case PlayerState::Paused:
        return "paused";
    }
    return "unknown";
}

PlaybackClock::PlaybackClock(NowFn now) : now_(std::move(now)) {}

void PlaybackClock::start() {
    state_ = PlayerState::Playing;
    startInstant_ = now_();
}

bool PlaybackClock::play() {
    if (state_ != PlayerState::Stopped)
        return false;
    start();
    return true;
}

bool PlaybackClock::resume() {
    if (state_ != PlayerState::Paused)
        return false;
    start();
    return true;
}

bool PlaybackClock::pause() {
    if (state_ != PlayerState::Playing)
        return false;
    tick();
    state_ = PlayerState::Paused;
    offset_ = timestamp_;
    return true;
}

bool PlaybackClock::reset() {
    if (state_ == PlayerState::Stopped)
        return false;
    state_ = PlayerState::Stopped;
    timestamp_ = Duration::zero();
    offset_ = Duration::zero();
    startInstant_.reset();
    return true;
}

Duration PlaybackClock::tick() {
    if (state_ == PlayerState::Playing && startInstant_) {
        auto elapsed =
                std::chrono::duration_cast<Duration>(now_() - *startInstant_);
        timestamp_ = offset_ + elapsed;
    }
    return timestamp_;
}

Duration PlaybackClock::setTimestamp(Duration t) {
    Duration upper = total_.value_or(Duration(std::numeric_limits<i64>::max()));
    t = std::clamp(t, Duration::zero(), upper);

    if (state_ == PlayerState::Playing)
        offset_ += t - timestamp_;
    else
        offset_ = t;

    timestamp_ = t;
    return timestamp_;
}

} // namespace babel
