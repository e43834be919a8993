/// @file types.hpp
/// @brief Core type definitions for tonic_sound

#pragma once

#include "fwd.hpp"

#include <tonic/core/error.hpp>

#include <spdlog/logger.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tonic_sound {

// =============================================================================
// Instance State
// =============================================================================

/// Lifecycle of a single playback
enum class InstanceState : std::uint8_t {
    Created,    ///< Spawned, play() not yet called
    Playing,    ///< Advancing through its window
    Paused,     ///< Suspended, position retained
    Completed,  ///< Reached the natural end of a non-looping window
    Stopped,    ///< Terminated by stop()
    Destroyed   ///< Released; terminal
};

const char* to_string(InstanceState state);

/// Completed and Stopped are terminal for playback; Destroyed follows them
[[nodiscard]] inline bool is_terminal(InstanceState state) {
    return state == InstanceState::Completed
        || state == InstanceState::Stopped
        || state == InstanceState::Destroyed;
}

// =============================================================================
// Effect Kinds
// =============================================================================

enum class EffectKind : std::uint8_t {
    Filter,
    Distortion,
    Equalizer,
    Stereo,
    Compressor
};

const char* to_string(EffectKind kind);

/// Biquad response used by FilterNode
enum class FilterType : std::uint8_t {
    LowPass,
    HighPass,
    BandPass
};

const char* to_string(FilterType type);

// =============================================================================
// Fade Units
// =============================================================================

/// Values below this are seconds, values at or above it are milliseconds
inline constexpr double kFadeMillisecondThreshold = 10.0;

/// Normalize a fade duration given in either unit to seconds
[[nodiscard]] double fade_to_seconds(double value);

// =============================================================================
// Callbacks
// =============================================================================

/// Fired when a play() call's instance reaches its natural end
using CompleteCallback = std::function<void(SoundAsset&)>;

/// Fired once a load attempt finishes; instance is set when the load autoplayed
using LoadedCallback = std::function<void(const tonic_core::Result<void>&, SoundAsset&, InstancePtr)>;

// =============================================================================
// Play Options
// =============================================================================

/// Per-call playback options; unset fields fall back to the asset's settings
struct PlayOptions {
    double start = 0.0;                  ///< Seconds into the buffer
    std::optional<double> end;           ///< Seconds; exclusive end of the window
    std::optional<float> speed;
    std::optional<bool> loop;
    double fade_in = 0.0;                ///< Seconds if < 10, else milliseconds
    double fade_out = 0.0;               ///< Seconds if < 10, else milliseconds
    std::optional<std::string> sprite;   ///< Overrides start, end and speed
    CompleteCallback complete;
    LoadedCallback loaded;
};

/// Resolved parameters handed to PlaybackInstance::play (fades in seconds)
struct PlayParams {
    double start = 0.0;
    std::optional<double> end;
    float speed = 1.0f;
    bool loop = false;
    double fade_in = 0.0;
    double fade_out = 0.0;
};

// =============================================================================
// Sprites
// =============================================================================

struct SpriteData {
    double start = 0.0;
    double end = 0.0;
    std::optional<float> speed;
};

using SpriteMap = std::map<std::string, SpriteData>;

// =============================================================================
// Asset Configuration
// =============================================================================

/// Construction settings for a SoundAsset
struct SoundConfig {
    std::string src;                     ///< Locator handed to the byte source
    std::vector<std::uint8_t> src_buffer;///< Encoded bytes already in memory
    bool auto_play = false;
    bool preload = false;
    bool single_instance = false;
    bool blocking = false;
    bool loop = false;
    float volume = 1.0f;
    float speed = 1.0f;
    SpriteMap sprites;
    LoadedCallback loaded;
    CompleteCallback complete;           ///< Used by autoplay

    [[nodiscard]] bool has_source() const { return !src.empty() || !src_buffer.empty(); }

    [[nodiscard]] static SoundConfig from_src(std::string locator) {
        SoundConfig config;
        config.src = std::move(locator);
        return config;
    }

    [[nodiscard]] static SoundConfig from_bytes(std::vector<std::uint8_t> bytes) {
        SoundConfig config;
        config.src_buffer = std::move(bytes);
        return config;
    }
};

/// Per-entry overrides applied on top of a shared SoundConfig
struct SoundOverrides {
    std::optional<bool> auto_play;
    std::optional<bool> single_instance;
    std::optional<bool> blocking;
    std::optional<bool> loop;
    std::optional<float> volume;
    std::optional<float> speed;
    std::optional<SpriteMap> sprites;

    /// Copy of base with every set override applied
    [[nodiscard]] SoundConfig apply(const SoundConfig& base) const;
};

// =============================================================================
// Output and Context Configuration
// =============================================================================

enum class OutputDeviceKind : std::uint8_t {
    Null,       ///< Silent; rendering is driven manually
    Miniaudio   ///< System playback device
};

const char* to_string(OutputDeviceKind kind);

struct ContextConfig {
    float volume = 1.0f;
    bool muted = false;
    bool async_decode = true;          ///< Decode on worker threads instead of inside update()
    std::uint32_t sample_rate = 44100;
    std::uint32_t channels = 2;
    std::uint32_t period_frames = 512;
};

// =============================================================================
// Logging
// =============================================================================

/// Logger shared by every tonic_sound component
std::shared_ptr<spdlog::logger> sound_logger();

} // namespace tonic_sound
