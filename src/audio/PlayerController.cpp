#include "PlayerController.hpp"
#include "core/Logger.hpp"

namespace babel {

PlayerController::PlayerController(std::unique_ptr<AudioPlayer> player,
                                   PlaybackClock::NowFn now)
    : player_(std::move(player)), clock_(std::move(now)) {}

PlayerController::~PlayerController() = default;

Result<void> PlayerController::setTrack(std::shared_ptr<AudioDetails> details) {
    if (!details)
        return Result<void>::err("No audio details");

    auto previous = clock_.state();
    clock_.reset();
    clock_.setTotalDuration(details->duration);
    clock_.setTimestamp(Duration::zero());
    track_ = std::move(details);

    Result<void> res = Result<void>::ok();
    if (audioAvailable()) {
        // The sink keeps its own copy, the details keep theirs for display
        res = player_->load(track_->data, track_->fileName);
        if (!res) {
            LOG_ERROR("{}", res.error().message);
            errorOccurred.emitSignal(res.error().message);
        }
    } else {
        LOG_WARN("No audio output, {} will play silently", track_->fileName);
    }

    setState(previous);
    positionChanged.emitSignal(clock_.timestamp());
    return res;
}

void PlayerController::startSink() {
    if (!audioAvailable() || !player_->hasTrack())
        return;
    if (auto res = player_->playFrom(clock_.timestamp()); !res) {
        LOG_ERROR("{}", res.error().message);
        errorOccurred.emitSignal(res.error().message);
    }
}

void PlayerController::setState(PlayerState previous) {
    if (previous != clock_.state()) {
        LOG_DEBUG("Player {} -> {}", toString(previous), toString(clock_.state()));
        stateChanged.emitSignal(clock_.state());
    }
}

void PlayerController::play() {
    auto previous = clock_.state();
    if (!clock_.play())
        return;
    startSink();
    setState(previous);
}

void PlayerController::resume() {
    auto previous = clock_.state();
    if (!clock_.resume())
        return;
    startSink();
    setState(previous);
}

void PlayerController::pause() {
    auto previous = clock_.state();
    if (!clock_.pause())
        return;
    if (audioAvailable())
        player_->pause();
    setState(previous);
    positionChanged.emitSignal(clock_.timestamp());
}

void PlayerController::reset() {
    auto previous = clock_.state();
    if (!clock_.reset())
        return;
    if (audioAvailable())
        player_->rewind();
    setState(previous);
    positionChanged.emitSignal(clock_.timestamp());
}

void PlayerController::togglePlayPause() {
    switch (clock_.state()) {
    case PlayerState::Stopped:
        play();
        break;
    case PlayerState::Paused:
        resume();
        break;
    case PlayerState::Playing:
        pause();
        break;
    }
}

void PlayerController::seek(Duration position) {
    auto before = clock_.timestamp();
    auto after = clock_.setTimestamp(position);
    if (after == before)
        return;

    if (clock_.state() == PlayerState::Playing)
        startSink();
    positionChanged.emitSignal(after);
}

void PlayerController::tick() {
    if (clock_.state() != PlayerState::Playing)
        return;

    clock_.tick();

    bool sinkFinished = audioAvailable() && player_->consumeFinished();
    if (clock_.reachedEnd() || sinkFinished) {
        LOG_INFO("End of track reached");
        pause();
        if (auto total = clock_.totalDuration(); total && clock_.timestamp() > *total) {
            clock_.setTimestamp(*total);
            positionChanged.emitSignal(clock_.timestamp());
        }
        return;
    }

    positionChanged.emitSignal(clock_.timestamp());
}

} // namespace babel
