#pragma once
// PlaybackClock.hpp - Player position bookkeeping
//
// While playing, timestamp = offset + (now - startInstant). Pausing folds
// the elapsed time into offset so resume continues where it left off.

#include <chrono>
#include <functional>
#include <optional>
#include "util/Types.hpp"

namespace babel {

enum class PlayerState { Stopped, Playing, Paused };

const char* toString(PlayerState state);

class PlaybackClock {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit PlaybackClock(NowFn now = &Clock::now);

    // Stopped -> Playing. Returns false in any other state.
    bool play();
    // Paused -> Playing
    bool resume();
    // Playing -> Paused
    bool pause();
    // Playing/Paused -> Stopped at 0
    bool reset();

    // Recomputes the timestamp while playing, returns it
    Duration tick();

    // User-edited position, clamped to [0, total]
    Duration setTimestamp(Duration t);

    void setTotalDuration(std::optional<Duration> total) {
        total_ = total;
    }
    std::optional<Duration> totalDuration() const {
        return total_;
    }

    PlayerState state() const {
        return state_;
    }
    Duration timestamp() const {
        return timestamp_;
    }
    Duration offset() const {
        return offset_;
    }
    bool reachedEnd() const {
        return total_ && timestamp_ >= *total_;
    }

private:
    void start();

    NowFn now_;
    PlayerState state_{PlayerState::Stopped};
    Duration timestamp_{0};
    Duration offset_{0};
    std::optional<Clock::time_point> startInstant_;
    std::optional<Duration> total_;
};

} // namespace babel
