/// @file buffer.hpp
/// @brief Decoded PCM buffers for tonic_sound

#pragma once

#include "fwd.hpp"

#include <tonic/core/error.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tonic_sound {

// =============================================================================
// Audio Buffer
// =============================================================================

/// Immutable interleaved 32-bit float PCM
class AudioBuffer {
public:
    AudioBuffer() = default;
    AudioBuffer(std::vector<float> samples, std::uint32_t channels, std::uint32_t sample_rate);

    [[nodiscard]] std::uint32_t channels() const { return m_channels; }
    [[nodiscard]] std::uint32_t sample_rate() const { return m_sample_rate; }
    [[nodiscard]] std::size_t frame_count() const;
    [[nodiscard]] double duration() const;
    [[nodiscard]] bool empty() const { return m_samples.empty(); }

    [[nodiscard]] const std::vector<float>& samples() const { return m_samples; }

    /// Sample at frame/channel; mono buffers answer every channel
    [[nodiscard]] float sample(std::size_t frame, std::uint32_t channel) const;

    /// Create silence buffer
    static BufferPtr create_silence(
        std::uint32_t channels,
        std::uint32_t sample_rate,
        double duration_seconds);

    /// Create sine wave buffer
    static BufferPtr create_sine_wave(
        float frequency,
        float amplitude,
        std::uint32_t channels,
        std::uint32_t sample_rate,
        double duration_seconds);

private:
    std::vector<float> m_samples;
    std::uint32_t m_channels = 0;
    std::uint32_t m_sample_rate = 0;
};

// =============================================================================
// Decoding
// =============================================================================

/// Decode an encoded file image (WAV, FLAC, MP3) into float PCM.
/// Runs synchronously; MixingContext::decode wraps it for asynchronous use.
tonic_core::Result<BufferPtr> decode_audio(const std::vector<std::uint8_t>& bytes);

} // namespace tonic_sound
