// Shared helpers for tonic_sound tests

#pragma once

#include <tonic/sound/sound.hpp>

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace tonic_test {

/// Little-endian PCM16 WAV file image holding a sine tone
inline std::vector<std::uint8_t> make_wav(
    double seconds,
    std::uint32_t sample_rate = 8000,
    std::uint16_t channels = 1,
    float frequency = 440.0f,
    float amplitude = 0.5f)
{
    const auto frames = static_cast<std::uint32_t>(std::lround(seconds * sample_rate));
    const std::uint32_t data_size = frames * channels * 2;

    std::vector<std::uint8_t> out;
    out.reserve(44 + data_size);

    auto put_tag = [&out](const char* tag) {
        out.insert(out.end(), tag, tag + 4);
    };
    auto put_u16 = [&out](std::uint16_t v) {
        out.push_back(static_cast<std::uint8_t>(v & 0xFF));
        out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    };
    auto put_u32 = [&out](std::uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
        }
    };

    put_tag("RIFF");
    put_u32(36 + data_size);
    put_tag("WAVE");

    put_tag("fmt ");
    put_u32(16);
    put_u16(1);                              // PCM
    put_u16(channels);
    put_u32(sample_rate);
    put_u32(sample_rate * channels * 2);     // byte rate
    put_u16(static_cast<std::uint16_t>(channels * 2));
    put_u16(16);

    put_tag("data");
    put_u32(data_size);

    constexpr double two_pi = 6.283185307179586;
    for (std::uint32_t i = 0; i < frames; ++i) {
        double t = static_cast<double>(i) / sample_rate;
        auto value = static_cast<std::int16_t>(std::lround(amplitude * 32767.0 * std::sin(two_pi * frequency * t)));
        for (std::uint16_t c = 0; c < channels; ++c) {
            put_u16(static_cast<std::uint16_t>(value));
        }
    }

    return out;
}

/// Context settings that keep every completion inside update()/flush()
inline tonic_sound::ContextConfig deferred_config() {
    tonic_sound::ContextConfig config;
    config.async_decode = false;
    return config;
}

/// Context on the null device with an in-memory byte source
struct SoundFixture {
    tonic_sound::MixingContext context{deferred_config()};
    tonic_sound::MemoryByteSource source{context.tasks()};

    SoundFixture() {
        source.insert("one_second.wav", make_wav(1.0));
        source.insert("two_seconds.wav", make_wav(2.0));
        source.insert("broken.wav", std::vector<std::uint8_t>{'n', 'o', 't', ' ', 'a', 'w', 'a', 'v'});
    }

    /// Advance the session clock in equal steps
    void advance(double seconds, double step = 0.25) {
        for (double t = 0.0; t < seconds - 1e-9; t += step) {
            context.update(step);
        }
    }

    tonic_sound::NullOutputDevice& device() {
        return static_cast<tonic_sound::NullOutputDevice&>(*context.device());
    }
};

/// Config for an asset fetched from the fixture's byte source
inline tonic_sound::SoundConfig preloaded(const std::string& locator) {
    auto config = tonic_sound::SoundConfig::from_src(locator);
    config.preload = true;
    return config;
}

} // namespace tonic_test
