/// @file types.cpp
/// @brief Type utilities for tonic_sound

#include <tonic/sound/types.hpp>
#include <tonic/core/log.hpp>

namespace tonic_sound {

const char* to_string(InstanceState state) {
    switch (state) {
        case InstanceState::Created: return "Created";
        case InstanceState::Playing: return "Playing";
        case InstanceState::Paused: return "Paused";
        case InstanceState::Completed: return "Completed";
        case InstanceState::Stopped: return "Stopped";
        case InstanceState::Destroyed: return "Destroyed";
        default: return "Unknown";
    }
}

const char* to_string(EffectKind kind) {
    switch (kind) {
        case EffectKind::Filter: return "Filter";
        case EffectKind::Distortion: return "Distortion";
        case EffectKind::Equalizer: return "Equalizer";
        case EffectKind::Stereo: return "Stereo";
        case EffectKind::Compressor: return "Compressor";
        default: return "Unknown";
    }
}

const char* to_string(FilterType type) {
    switch (type) {
        case FilterType::LowPass: return "LowPass";
        case FilterType::HighPass: return "HighPass";
        case FilterType::BandPass: return "BandPass";
        default: return "Unknown";
    }
}

const char* to_string(OutputDeviceKind kind) {
    switch (kind) {
        case OutputDeviceKind::Null: return "null";
        case OutputDeviceKind::Miniaudio: return "miniaudio";
        default: return "unknown";
    }
}

double fade_to_seconds(double value) {
    if (value <= 0.0) {
        return 0.0;
    }
    return value < kFadeMillisecondThreshold ? value : value / 1000.0;
}

SoundConfig SoundOverrides::apply(const SoundConfig& base) const {
    SoundConfig config = base;
    if (auto_play) config.auto_play = *auto_play;
    if (single_instance) config.single_instance = *single_instance;
    if (blocking) config.blocking = *blocking;
    if (loop) config.loop = *loop;
    if (volume) config.volume = *volume;
    if (speed) config.speed = *speed;
    if (sprites) config.sprites = *sprites;
    return config;
}

std::shared_ptr<spdlog::logger> sound_logger() {
    return tonic_core::get_logger("tonic_sound");
}

} // namespace tonic_sound
