/// @file buffer.cpp
/// @brief AudioBuffer implementation for tonic_sound

#include <tonic/sound/buffer.hpp>

#include <cmath>

namespace tonic_sound {

AudioBuffer::AudioBuffer(std::vector<float> samples, std::uint32_t channels, std::uint32_t sample_rate)
    : m_samples(std::move(samples))
    , m_channels(channels)
    , m_sample_rate(sample_rate) {}

std::size_t AudioBuffer::frame_count() const {
    if (m_channels == 0) return 0;
    return m_samples.size() / m_channels;
}

double AudioBuffer::duration() const {
    if (m_sample_rate == 0) return 0.0;
    return static_cast<double>(frame_count()) / static_cast<double>(m_sample_rate);
}

float AudioBuffer::sample(std::size_t frame, std::uint32_t channel) const {
    if (m_channels == 0 || frame >= frame_count()) return 0.0f;
    std::uint32_t c = channel < m_channels ? channel : m_channels - 1;
    return m_samples[frame * m_channels + c];
}

BufferPtr AudioBuffer::create_silence(
    std::uint32_t channels,
    std::uint32_t sample_rate,
    double duration_seconds) {

    auto frames = static_cast<std::size_t>(sample_rate * duration_seconds);
    return std::make_shared<AudioBuffer>(
        std::vector<float>(frames * channels, 0.0f), channels, sample_rate);
}

BufferPtr AudioBuffer::create_sine_wave(
    float frequency,
    float amplitude,
    std::uint32_t channels,
    std::uint32_t sample_rate,
    double duration_seconds) {

    constexpr double two_pi = 6.283185307179586;
    auto frames = static_cast<std::size_t>(sample_rate * duration_seconds);
    std::vector<float> samples(frames * channels);

    for (std::size_t i = 0; i < frames; ++i) {
        double t = static_cast<double>(i) / sample_rate;
        auto value = static_cast<float>(amplitude * std::sin(two_pi * frequency * t));
        for (std::uint32_t c = 0; c < channels; ++c) {
            samples[i * channels + c] = value;
        }
    }

    return std::make_shared<AudioBuffer>(std::move(samples), channels, sample_rate);
}

} // namespace tonic_sound
