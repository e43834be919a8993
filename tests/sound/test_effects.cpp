// tonic_sound effect node tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <tonic/sound/effects.hpp>

#include <cmath>
#include <vector>

using namespace tonic_sound;
using Catch::Approx;

namespace {

constexpr std::uint32_t kRate = 44100;

std::vector<float> stereo_sine(float frequency, std::size_t frames, float amplitude = 0.5f) {
    std::vector<float> out(frames * 2);
    for (std::size_t i = 0; i < frames; ++i) {
        float v = amplitude * std::sin(6.2831853f * frequency * static_cast<float>(i) / kRate);
        out[i * 2] = v;
        out[i * 2 + 1] = v;
    }
    return out;
}

float rms(const std::vector<float>& samples, std::size_t skip = 0) {
    double sum = 0.0;
    for (std::size_t i = skip; i < samples.size(); ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(samples.size() - skip)));
}

} // anonymous namespace

// =============================================================================
// Parameters
// =============================================================================

TEST_CASE("Effect parameters", "[sound][effects]") {
    FilterNode filter(FilterType::LowPass, 800.0f);

    SECTION("declared parameters are listed") {
        auto names = filter.parameter_names();
        REQUIRE(names.size() == 2);
        REQUIRE(filter.parameter("frequency").value() == Approx(800.0f));
        REQUIRE_FALSE(filter.parameter("gain").has_value());
    }

    SECTION("values are clamped to their range") {
        REQUIRE(filter.set_parameter("frequency", 1e6f));
        REQUIRE(filter.parameter("frequency").value() == Approx(22050.0f));
    }

    SECTION("unknown key is an invalid option") {
        auto result = filter.set_parameter("resonance", 2.0f);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().is<tonic_core::ConfigError>());
        REQUIRE(result.error().code() == tonic_core::ErrorCode::InvalidArgument);
    }

    SECTION("non-finite values are rejected") {
        REQUIRE_FALSE(filter.set_parameter("q", std::nanf("")));
        REQUIRE(filter.parameter("q").value() == Approx(0.707f));
    }

    SECTION("mix is clamped") {
        filter.set_mix(3.0f);
        REQUIRE(filter.mix() == Approx(1.0f));
        filter.set_mix(-1.0f);
        REQUIRE(filter.mix() == Approx(0.0f));
    }
}

TEST_CASE("Effect factory", "[sound][effects]") {
    for (auto kind : {EffectKind::Filter, EffectKind::Distortion, EffectKind::Equalizer,
                      EffectKind::Stereo, EffectKind::Compressor}) {
        auto node = create_effect(kind);
        REQUIRE(node != nullptr);
        REQUIRE(node->kind() == kind);
        REQUIRE(node->attachment_count() == 0);
    }

    REQUIRE(create_effect(EffectKind::Stereo)->allows_fan_out());
    REQUIRE_FALSE(create_effect(EffectKind::Filter)->allows_fan_out());
}

// =============================================================================
// Processing
// =============================================================================

TEST_CASE("FilterNode shapes the spectrum", "[sound][effects]") {
    constexpr std::size_t frames = 4096;

    SECTION("low-pass attenuates high frequencies") {
        FilterNode filter(FilterType::LowPass, 500.0f);
        filter.set_sample_rate(kRate);

        auto high = stereo_sine(8000.0f, frames);
        const float before = rms(high);
        filter.process(high.data(), frames, 2);
        REQUIRE(rms(high, 512) < before * 0.1f);
    }

    SECTION("low-pass keeps low frequencies") {
        FilterNode filter(FilterType::LowPass, 5000.0f);
        filter.set_sample_rate(kRate);

        auto low = stereo_sine(100.0f, frames);
        const float before = rms(low);
        filter.process(low.data(), frames, 2);
        REQUIRE(rms(low, 512) == Approx(before).epsilon(0.1));
    }

    SECTION("telephone preset is a band-pass") {
        auto phone = FilterNode::telephone();
        REQUIRE(phone->filter_type() == FilterType::BandPass);
        REQUIRE(phone->parameter("frequency").value() == Approx(1700.0f));
    }

    SECTION("disabled node is a pass-through") {
        FilterNode filter(FilterType::HighPass, 5000.0f);
        filter.set_enabled(false);

        auto signal = stereo_sine(100.0f, 256);
        auto copy = signal;
        filter.process(signal.data(), 256, 2);
        REQUIRE(signal == copy);
    }

    SECTION("zero mix returns the dry signal") {
        FilterNode filter(FilterType::HighPass, 5000.0f);
        filter.set_mix(0.0f);

        auto signal = stereo_sine(100.0f, 256);
        auto copy = signal;
        filter.process(signal.data(), 256, 2);
        REQUIRE(signal == copy);
    }
}

TEST_CASE("DistortionNode soft-clips", "[sound][effects]") {
    DistortionNode node(0.0f);
    auto signal = stereo_sine(440.0f, 512, 0.2f);
    auto copy = signal;

    node.process(signal.data(), 512, 2);
    REQUIRE(signal == copy);

    REQUIRE(node.set_parameter("amount", 1.0f));
    node.process(signal.data(), 512, 2);
    for (float s : signal) {
        REQUIRE(std::abs(s) <= 1.0f + 1e-5f);
    }
    REQUIRE(rms(signal) > rms(copy));
}

TEST_CASE("EqualizerNode bands", "[sound][effects]") {
    EqualizerNode eq;

    REQUIRE(EqualizerNode::band_key(0) == "f32");
    REQUIRE(EqualizerNode::band_key(9) == "f16k");
    REQUIRE(eq.parameter_names().size() == EqualizerNode::kBandCount);

    SECTION("flat equalizer is a pass-through") {
        auto signal = stereo_sine(1000.0f, 256);
        auto copy = signal;
        eq.process(signal.data(), 256, 2);
        REQUIRE(signal == copy);
    }

    SECTION("boosting a band raises its level") {
        eq.set_sample_rate(kRate);
        REQUIRE(eq.set_band_gain(5, 12.0f));
        REQUIRE(eq.band_gain(5) == Approx(12.0f));

        auto signal = stereo_sine(1000.0f, 4096);
        const float before = rms(signal);
        eq.process(signal.data(), 4096, 2);
        REQUIRE(rms(signal, 1024) > before * 2.0f);
    }

    SECTION("band index out of range") {
        REQUIRE_FALSE(eq.set_band_gain(EqualizerNode::kBandCount, 3.0f));
    }
}

TEST_CASE("StereoNode pans with constant power", "[sound][effects]") {
    StereoNode node;
    std::vector<float> frame = {0.5f, 0.5f};

    SECTION("centre leaves the signal untouched") {
        node.process(frame.data(), 1, 2);
        REQUIRE(frame[0] == Approx(0.5f));
        REQUIRE(frame[1] == Approx(0.5f));
    }

    SECTION("hard left folds the right channel into the left") {
        REQUIRE(node.set_parameter("pan", -1.0f));
        node.process(frame.data(), 1, 2);
        REQUIRE(frame[0] == Approx(1.0f));
        REQUIRE(frame[1] == Approx(0.0f).margin(1e-6));
    }

    SECTION("hard right folds the left channel into the right") {
        REQUIRE(node.set_parameter("pan", 1.0f));
        node.process(frame.data(), 1, 2);
        REQUIRE(frame[0] == Approx(0.0f).margin(1e-6));
        REQUIRE(frame[1] == Approx(1.0f));
    }

    SECTION("mono input is left alone") {
        REQUIRE(node.set_parameter("pan", 1.0f));
        float mono = 0.5f;
        node.process(&mono, 1, 1);
        REQUIRE(mono == Approx(0.5f));
    }
}

TEST_CASE("CompressorNode reduces loud signals", "[sound][effects]") {
    SECTION("quiet signal passes") {
        auto limiter = CompressorNode::limiter();
        limiter->set_sample_rate(kRate);
        auto signal = stereo_sine(440.0f, 2048, 0.1f);
        auto copy = signal;
        limiter->process(signal.data(), 2048, 2);
        REQUIRE(rms(signal) == Approx(rms(copy)).epsilon(0.01));
        REQUIRE(limiter->gain_reduction() == Approx(0.0f).margin(1e-4));
    }

    SECTION("loud signal is reduced") {
        CompressorNode compressor;
        compressor.set_sample_rate(kRate);
        auto signal = stereo_sine(440.0f, 8192, 0.9f);
        const float before = rms(signal);
        compressor.process(signal.data(), 8192, 2);
        REQUIRE(compressor.gain_reduction() > 0.0f);
        REQUIRE(rms(signal, 4096) < before);
    }

    SECTION("reset clears the envelope") {
        CompressorNode compressor;
        auto signal = stereo_sine(440.0f, 4096, 0.9f);
        compressor.process(signal.data(), 4096, 2);
        REQUIRE(compressor.gain_reduction() > 0.0f);
        compressor.reset();
        REQUIRE(compressor.gain_reduction() == Approx(0.0f));
    }

    SECTION("limiter settings") {
        auto limiter = CompressorNode::limiter();
        REQUIRE(limiter->name() == "Limiter");
        REQUIRE(limiter->parameter("threshold").value() == Approx(-1.0f));
        REQUIRE(limiter->parameter("ratio").value() == Approx(20.0f));
    }
}
