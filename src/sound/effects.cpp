/// @file effects.cpp
/// @brief Effect node implementations for tonic_sound

#include <tonic/sound/effects.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace tonic_sound {

namespace {

constexpr float kPi = 3.14159265358979f;

/// Keep biquad centre frequencies below Nyquist
float clamp_frequency(float hz, std::uint32_t sample_rate) {
    return std::clamp(hz, 10.0f, 0.45f * static_cast<float>(sample_rate));
}

} // anonymous namespace

// =============================================================================
// EffectNodeBase Implementation
// =============================================================================

EffectNodeBase::EffectNodeBase(EffectKind kind, std::string name)
    : m_kind(kind)
    , m_name(std::move(name)) {}

bool EffectNodeBase::is_enabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_enabled;
}

void EffectNodeBase::set_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_enabled = enabled;
}

float EffectNodeBase::mix() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_mix;
}

void EffectNodeBase::set_mix(float mix) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_mix = std::clamp(mix, 0.0f, 1.0f);
}

std::vector<std::string> EffectNodeBase::parameter_names() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    names.reserve(m_params.size());
    for (const auto& [key, p] : m_params) {
        names.push_back(key);
    }
    return names;
}

std::optional<float> EffectNodeBase::parameter(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_params.find(key);
    if (it == m_params.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

tonic_core::Result<void> EffectNodeBase::set_parameter(const std::string& key, float value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_params.find(key);
    if (it == m_params.end()) {
        return tonic_core::Err(tonic_core::ConfigError::invalid_option(
            key, "no such parameter on " + m_name));
    }
    if (!std::isfinite(value)) {
        return tonic_core::Err(tonic_core::ConfigError::invalid_option(key, "value is not finite"));
    }
    it->second.value = std::clamp(value, it->second.min, it->second.max);
    on_parameters_changed();
    return tonic_core::Ok();
}

void EffectNodeBase::set_sample_rate(std::uint32_t rate) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (rate == 0 || rate == m_sample_rate) return;
    m_sample_rate = rate;
    on_parameters_changed();
}

void EffectNodeBase::process(float* samples, std::size_t frames, std::uint32_t channels) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_enabled || channels == 0 || frames == 0) return;

    const std::size_t count = frames * channels;
    if (m_mix < 1.0f) {
        m_dry.assign(samples, samples + count);
    }

    render(samples, frames, channels);

    if (m_mix < 1.0f) {
        apply_mix(m_dry.data(), samples, count);
    }
}

void EffectNodeBase::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    clear_state();
}

void EffectNodeBase::declare(const std::string& key, float value, float min, float max) {
    m_params[key] = Param{std::clamp(value, min, max), min, max};
}

float EffectNodeBase::param(const std::string& key) const {
    auto it = m_params.find(key);
    return it != m_params.end() ? it->second.value : 0.0f;
}

void EffectNodeBase::apply_mix(const float* dry, float* wet, std::size_t count) const {
    if (m_mix >= 1.0f) return;
    if (m_mix <= 0.0f) {
        std::memcpy(wet, dry, count * sizeof(float));
        return;
    }

    float wet_amount = m_mix;
    float dry_amount = 1.0f - m_mix;

    for (std::size_t i = 0; i < count; ++i) {
        wet[i] = dry[i] * dry_amount + wet[i] * wet_amount;
    }
}

// =============================================================================
// FilterNode Implementation
// =============================================================================

FilterNode::FilterNode(FilterType type, float frequency, float q)
    : EffectNodeBase(EffectKind::Filter, "Filter")
    , m_type(type) {
    declare("frequency", frequency, 10.0f, 22050.0f);
    declare("q", q, 0.0001f, 100.0f);
    on_parameters_changed();
}

std::shared_ptr<FilterNode> FilterNode::telephone() {
    return std::make_shared<FilterNode>(FilterType::BandPass, 1700.0f, 1.2f);
}

FilterType FilterNode::filter_type() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_type;
}

void FilterNode::set_filter_type(FilterType type) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_type = type;
    on_parameters_changed();
}

void FilterNode::on_parameters_changed() {
    const float freq = clamp_frequency(param("frequency"), m_sample_rate);
    const float q = param("q");
    const float omega = 2.0f * kPi * freq / static_cast<float>(m_sample_rate);
    const float sin_omega = std::sin(omega);
    const float cos_omega = std::cos(omega);
    const float alpha = sin_omega / (2.0f * q);

    float b0 = 1, b1 = 0, b2 = 0, a0 = 1, a1 = 0, a2 = 0;

    switch (m_type) {
        case FilterType::LowPass:
            b0 = (1.0f - cos_omega) / 2.0f;
            b1 = 1.0f - cos_omega;
            b2 = (1.0f - cos_omega) / 2.0f;
            break;
        case FilterType::HighPass:
            b0 = (1.0f + cos_omega) / 2.0f;
            b1 = -(1.0f + cos_omega);
            b2 = (1.0f + cos_omega) / 2.0f;
            break;
        case FilterType::BandPass:
            b0 = alpha;
            b1 = 0;
            b2 = -alpha;
            break;
    }
    a0 = 1.0f + alpha;
    a1 = -2.0f * cos_omega;
    a2 = 1.0f - alpha;

    m_b0 = b0 / a0;
    m_b1 = b1 / a0;
    m_b2 = b2 / a0;
    m_a1 = a1 / a0;
    m_a2 = a2 / a0;
}

void FilterNode::render(float* samples, std::size_t frames, std::uint32_t channels) {
    const std::uint32_t filtered = std::min(channels, 2u);
    for (std::size_t i = 0; i < frames; ++i) {
        for (std::uint32_t c = 0; c < filtered; ++c) {
            float x = samples[i * channels + c];
            float y = m_b0 * x + m_b1 * m_x1[c] + m_b2 * m_x2[c]
                    - m_a1 * m_y1[c] - m_a2 * m_y2[c];

            m_x2[c] = m_x1[c];
            m_x1[c] = x;
            m_y2[c] = m_y1[c];
            m_y1[c] = y;

            samples[i * channels + c] = y;
        }
    }
}

void FilterNode::clear_state() {
    m_x1 = {0, 0};
    m_x2 = {0, 0};
    m_y1 = {0, 0};
    m_y2 = {0, 0};
}

// =============================================================================
// DistortionNode Implementation
// =============================================================================

DistortionNode::DistortionNode(float amount)
    : EffectNodeBase(EffectKind::Distortion, "Distortion") {
    declare("amount", amount, 0.0f, 1.0f);
}

void DistortionNode::render(float* samples, std::size_t frames, std::uint32_t channels) {
    const float amount = param("amount");
    if (amount <= 0.0f) return;

    const float drive = 1.0f + amount * 50.0f;
    const float norm = 1.0f / std::tanh(drive);
    for (std::size_t i = 0; i < frames * channels; ++i) {
        samples[i] = std::tanh(samples[i] * drive) * norm;
    }
}

// =============================================================================
// EqualizerNode Implementation
// =============================================================================

EqualizerNode::EqualizerNode()
    : EffectNodeBase(EffectKind::Equalizer, "Equalizer") {
    for (std::size_t i = 0; i < kBandCount; ++i) {
        declare(band_key(i), 0.0f, -40.0f, 40.0f);
    }
    on_parameters_changed();
}

std::string EqualizerNode::band_key(std::size_t index) {
    static const std::array<const char*, kBandCount> keys = {
        "f32", "f64", "f125", "f250", "f500", "f1k", "f2k", "f4k", "f8k", "f16k"
    };
    return index < kBandCount ? keys[index] : std::string{};
}

tonic_core::Result<void> EqualizerNode::set_band_gain(std::size_t index, float db) {
    if (index >= kBandCount) {
        return tonic_core::Err(tonic_core::ConfigError::invalid_option(
            "band", "index " + std::to_string(index) + " out of range"));
    }
    return set_parameter(band_key(index), db);
}

float EqualizerNode::band_gain(std::size_t index) const {
    return parameter(band_key(index)).value_or(0.0f);
}

void EqualizerNode::on_parameters_changed() {
    constexpr float q = 1.41f;  // one octave

    for (std::size_t i = 0; i < kBandCount; ++i) {
        auto& band = m_bands[i];
        const float gain_db = param(band_key(i));
        const float a = std::pow(10.0f, gain_db / 40.0f);
        const float freq = clamp_frequency(kFrequencies[i], m_sample_rate);
        const float omega = 2.0f * kPi * freq / static_cast<float>(m_sample_rate);
        const float alpha = std::sin(omega) / (2.0f * q);
        const float cos_omega = std::cos(omega);

        const float a0 = 1.0f + alpha / a;
        band.b0 = (1.0f + alpha * a) / a0;
        band.b1 = (-2.0f * cos_omega) / a0;
        band.b2 = (1.0f - alpha * a) / a0;
        band.a1 = (-2.0f * cos_omega) / a0;
        band.a2 = (1.0f - alpha / a) / a0;
    }
}

void EqualizerNode::render(float* samples, std::size_t frames, std::uint32_t channels) {
    const std::uint32_t filtered = std::min(channels, 2u);

    for (std::size_t b = 0; b < kBandCount; ++b) {
        if (param(band_key(b)) == 0.0f) continue;  // flat band is identity
        auto& band = m_bands[b];

        for (std::size_t i = 0; i < frames; ++i) {
            for (std::uint32_t c = 0; c < filtered; ++c) {
                float x = samples[i * channels + c];
                float y = band.b0 * x + band.b1 * band.x1[c] + band.b2 * band.x2[c]
                        - band.a1 * band.y1[c] - band.a2 * band.y2[c];

                band.x2[c] = band.x1[c];
                band.x1[c] = x;
                band.y2[c] = band.y1[c];
                band.y1[c] = y;

                samples[i * channels + c] = y;
            }
        }
    }
}

void EqualizerNode::clear_state() {
    for (auto& band : m_bands) {
        band.x1 = {0, 0};
        band.x2 = {0, 0};
        band.y1 = {0, 0};
        band.y2 = {0, 0};
    }
}

// =============================================================================
// StereoNode Implementation
// =============================================================================

StereoNode::StereoNode(float pan)
    : EffectNodeBase(EffectKind::Stereo, "Stereo") {
    declare("pan", pan, -1.0f, 1.0f);
}

void StereoNode::render(float* samples, std::size_t frames, std::uint32_t channels) {
    if (channels < 2) return;

    const float pan = param("pan");
    if (pan == 0.0f) return;

    // Equal-power stereo panning: the side being panned away from folds into the other
    const float x = pan <= 0.0f ? pan + 1.0f : pan;
    const float gain_l = std::cos(x * kPi / 2.0f);
    const float gain_r = std::sin(x * kPi / 2.0f);

    for (std::size_t i = 0; i < frames; ++i) {
        float& l = samples[i * channels];
        float& r = samples[i * channels + 1];
        const float in_l = l;
        const float in_r = r;
        if (pan <= 0.0f) {
            l = in_l + in_r * gain_l;
            r = in_r * gain_r;
        } else {
            l = in_l * gain_l;
            r = in_r + in_l * gain_r;
        }
    }
}

// =============================================================================
// CompressorNode Implementation
// =============================================================================

CompressorNode::CompressorNode()
    : EffectNodeBase(EffectKind::Compressor, "Compressor") {
    declare("threshold", -24.0f, -100.0f, 0.0f);
    declare("knee", 30.0f, 0.0f, 40.0f);
    declare("ratio", 12.0f, 1.0f, 20.0f);
    declare("attack", 0.003f, 0.0001f, 1.0f);
    declare("release", 0.25f, 0.001f, 1.0f);
}

std::shared_ptr<CompressorNode> CompressorNode::limiter() {
    auto node = std::make_shared<CompressorNode>();
    node->m_name = "Limiter";
    node->declare("threshold", -1.0f, -100.0f, 0.0f);
    node->declare("knee", 0.0f, 0.0f, 40.0f);
    node->declare("ratio", 20.0f, 1.0f, 20.0f);
    node->declare("attack", 0.001f, 0.0001f, 1.0f);
    node->declare("release", 0.1f, 0.001f, 1.0f);
    return node;
}

float CompressorNode::gain_reduction() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_gain_reduction;
}

float CompressorNode::compute_gain(float input_db) const {
    const float threshold = param("threshold");
    const float ratio = param("ratio");
    const float knee = param("knee");

    if (knee > 0) {
        const float knee_start = threshold - knee / 2.0f;
        const float knee_end = threshold + knee / 2.0f;

        if (input_db < knee_start) {
            return 0;
        } else if (input_db > knee_end) {
            return (threshold - input_db) * (1.0f - 1.0f / ratio);
        }
        const float x = input_db - knee_start;
        const float a = 1.0f / ratio - 1.0f;
        return a * x * x / (2.0f * knee);
    }

    if (input_db < threshold) {
        return 0;
    }
    return (threshold - input_db) * (1.0f - 1.0f / ratio);
}

void CompressorNode::render(float* samples, std::size_t frames, std::uint32_t channels) {
    const float rate = static_cast<float>(m_sample_rate);
    const float attack_coeff = std::exp(-1.0f / (param("attack") * rate));
    const float release_coeff = std::exp(-1.0f / (param("release") * rate));

    for (std::size_t i = 0; i < frames; ++i) {
        float peak = 0;
        for (std::uint32_t c = 0; c < channels; ++c) {
            peak = std::max(peak, std::abs(samples[i * channels + c]));
        }

        const float input_db = 20.0f * std::log10(std::max(peak, 1e-6f));
        const float target = compute_gain(input_db);

        const float coeff = target < m_envelope ? attack_coeff : release_coeff;
        m_envelope = m_envelope * coeff + target * (1.0f - coeff);
        m_gain_reduction = -m_envelope;

        const float gain = std::pow(10.0f, m_envelope / 20.0f);
        for (std::uint32_t c = 0; c < channels; ++c) {
            samples[i * channels + c] *= gain;
        }
    }
}

void CompressorNode::clear_state() {
    m_envelope = 0;
    m_gain_reduction = 0;
}

// =============================================================================
// Factory
// =============================================================================

EffectNodePtr create_effect(EffectKind kind) {
    switch (kind) {
        case EffectKind::Filter: return std::make_shared<FilterNode>();
        case EffectKind::Distortion: return std::make_shared<DistortionNode>();
        case EffectKind::Equalizer: return std::make_shared<EqualizerNode>();
        case EffectKind::Stereo: return std::make_shared<StereoNode>();
        case EffectKind::Compressor: return std::make_shared<CompressorNode>();
    }
    return nullptr;
}

} // namespace tonic_sound
