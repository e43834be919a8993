/// @file decoder.cpp
/// @brief Encoded audio to float PCM via miniaudio's decoder

#include <miniaudio.h>

#include <tonic/sound/buffer.hpp>

#include <string>

namespace tonic_sound {

namespace {

constexpr ma_uint64 kDecodeChunkFrames = 4096;

} // anonymous namespace

tonic_core::Result<BufferPtr> decode_audio(const std::vector<std::uint8_t>& bytes) {
    if (bytes.empty()) {
        return tonic_core::Err<BufferPtr>(tonic_core::LoadError::decode_failed("empty input"));
    }

    // Native channel count and rate, float samples
    ma_decoder_config config = ma_decoder_config_init(ma_format_f32, 0, 0);
    ma_decoder decoder;
    ma_result init = ma_decoder_init_memory(bytes.data(), bytes.size(), &config, &decoder);
    if (init != MA_SUCCESS) {
        return tonic_core::Err<BufferPtr>(
            tonic_core::LoadError::decode_failed(ma_result_description(init)));
    }

    const std::uint32_t channels = decoder.outputChannels;
    const std::uint32_t sample_rate = decoder.outputSampleRate;

    std::vector<float> samples;
    std::vector<float> chunk(kDecodeChunkFrames * channels);

    for (;;) {
        ma_uint64 frames_read = 0;
        ma_result r = ma_decoder_read_pcm_frames(&decoder, chunk.data(), kDecodeChunkFrames, &frames_read);
        samples.insert(samples.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(frames_read * channels));
        if (r != MA_SUCCESS && r != MA_AT_END) {
            ma_decoder_uninit(&decoder);
            return tonic_core::Err<BufferPtr>(
                tonic_core::LoadError::decode_failed(ma_result_description(r)));
        }
        if (r == MA_AT_END || frames_read < kDecodeChunkFrames) {
            break;
        }
    }

    ma_decoder_uninit(&decoder);

    if (samples.empty() || channels == 0 || sample_rate == 0) {
        return tonic_core::Err<BufferPtr>(tonic_core::LoadError::decode_failed("no audio frames"));
    }

    BufferPtr buffer = std::make_shared<AudioBuffer>(std::move(samples), channels, sample_rate);
    return tonic_core::Ok(std::move(buffer));
}

} // namespace tonic_sound
