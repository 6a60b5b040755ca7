#include "AudioPlayer.hpp"
#include <SDL2/SDL.h>
#include <SDL2/SDL_mixer.h>
#include <algorithm>
#include "core/Logger.hpp"

namespace babel {

std::atomic<bool> AudioPlayer::finished_{false};

AudioPlayer::AudioPlayer() = default;

AudioPlayer::~AudioPlayer() {
    shutdown();
}

Result<void> AudioPlayer::init(const AudioConfig& cfg) {
    if (initialized_)
        return Result<void>::ok();

    if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
        return Result<void>::err(std::string("SDL audio init failed: ") +
                                 SDL_GetError());
    }

    const char* device = cfg.device == "default" ? nullptr : cfg.device.c_str();
    if (Mix_OpenAudioDevice(static_cast<int>(cfg.sampleRate),
                            MIX_DEFAULT_FORMAT,
                            2,
                            static_cast<int>(cfg.bufferSize),
                            device,
                            SDL_AUDIO_ALLOW_FREQUENCY_CHANGE) < 0) {
        std::string err = Mix_GetError();
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        return Result<void>::err("SDL_mixer open failed: " + err);
    }

    Mix_HookMusicFinished(&AudioPlayer::onMusicFinished);
    initialized_ = true;
    setVolume(cfg.volume);

    LOG_INFO("AudioPlayer initialized: device='{}', rate={} Hz, buffer={}",
             cfg.device,
             cfg.sampleRate,
             cfg.bufferSize);
    return Result<void>::ok();
}

void AudioPlayer::shutdown() {
    if (!initialized_)
        return;
    unload();
    Mix_HookMusicFinished(nullptr);
    Mix_CloseAudio();
    SDL_QuitSubSystem(SDL_INIT_AUDIO);
    initialized_ = false;
}

void AudioPlayer::onMusicFinished() {
    finished_ = true;
}

Result<void> AudioPlayer::load(std::vector<u8> data, const std::string& name) {
    if (!initialized_)
        return Result<void>::err("Audio output is not available");

    unload();
    data_ = std::move(data);

    SDL_RWops* rw = SDL_RWFromConstMem(data_.data(), static_cast<int>(data_.size()));
    if (!rw) {
        data_.clear();
        return Result<void>::err(std::string("Failed to wrap audio data: ") +
                                 SDL_GetError());
    }

    music_ = Mix_LoadMUS_RW(rw, 1);
    if (!music_) {
        data_.clear();
        return Result<void>::err("Failed to decode " + name + ": " +
                                 Mix_GetError());
    }

    name_ = name;
    started_ = false;
    finished_ = false;
    LOG_INFO("Loaded audio: {} ({} bytes)", name_, data_.size());
    return Result<void>::ok();
}

void AudioPlayer::unload() {
    if (music_) {
        Mix_HaltMusic();
        Mix_FreeMusic(music_);
        music_ = nullptr;
    }
    data_.clear();
    data_.shrink_to_fit();
    started_ = false;
}

Result<void> AudioPlayer::playFrom(Duration position) {
    if (!music_)
        return Result<void>::err("No audio loaded");

    double seconds = static_cast<double>(position.count()) / 1000.0;

    if (!started_ || !Mix_PlayingMusic()) {
        finished_ = false;
        if (Mix_PlayMusic(music_, 1) < 0) {
            return Result<void>::err(std::string("Failed to play music: ") +
                                     Mix_GetError());
        }
        started_ = true;
    }

    if (Mix_SetMusicPosition(seconds) < 0) {
        LOG_WARN("Seek to {:.3f}s not supported for {}: {}",
                 seconds,
                 name_,
                 Mix_GetError());
    }

    if (Mix_PausedMusic())
        Mix_ResumeMusic();

    LOG_DEBUG("Playback from {:.3f}s", seconds);
    return Result<void>::ok();
}

void AudioPlayer::pause() {
    if (music_ && Mix_PlayingMusic())
        Mix_PauseMusic();
}

void AudioPlayer::rewind() {
    if (!music_)
        return;
    pause();
    if (started_ && Mix_PlayingMusic())
        Mix_RewindMusic();
}

void AudioPlayer::setVolume(f32 volume) {
    if (!initialized_)
        return;
    volume = std::clamp(volume, 0.0f, 1.0f);
    Mix_VolumeMusic(static_cast<int>(volume * MIX_MAX_VOLUME));
}

bool AudioPlayer::isPlaying() const {
    return music_ && Mix_PlayingMusic() && !Mix_PausedMusic();
}

} // namespace babel
