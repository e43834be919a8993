/// @file effects.hpp
/// @brief Effect nodes for tonic_sound node chains

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <tonic/core/error.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tonic_sound {

// =============================================================================
// Effect Node Interface
// =============================================================================

/// Opaque processing stage placed between an asset's source and gain.
/// Parameters are addressed by name; process() runs on the render thread.
class IEffectNode {
public:
    virtual ~IEffectNode() = default;

    [[nodiscard]] virtual EffectKind kind() const = 0;
    [[nodiscard]] virtual const std::string& name() const = 0;

    [[nodiscard]] virtual bool is_enabled() const = 0;
    virtual void set_enabled(bool enabled) = 0;

    /// Wet/dry mix (0 = dry, 1 = wet)
    [[nodiscard]] virtual float mix() const = 0;
    virtual void set_mix(float mix) = 0;

    [[nodiscard]] virtual std::vector<std::string> parameter_names() const = 0;
    [[nodiscard]] virtual std::optional<float> parameter(const std::string& key) const = 0;
    virtual tonic_core::Result<void> set_parameter(const std::string& key, float value) = 0;

    /// Process interleaved frames in place
    virtual void process(float* samples, std::size_t frames, std::uint32_t channels) = 0;

    /// Clear internal filter state
    virtual void reset() = 0;

    virtual void set_sample_rate(std::uint32_t rate) = 0;

    /// Whether one node may be attached to several chains at once
    [[nodiscard]] virtual bool allows_fan_out() const { return false; }

    // Chain bookkeeping (control thread)
    [[nodiscard]] virtual std::uint32_t attachment_count() const = 0;
    virtual void on_attached() = 0;
    virtual void on_detached() = 0;
};

// =============================================================================
// Base Node Implementation
// =============================================================================

class EffectNodeBase : public IEffectNode {
public:
    [[nodiscard]] EffectKind kind() const override { return m_kind; }
    [[nodiscard]] const std::string& name() const override { return m_name; }
    [[nodiscard]] bool is_enabled() const override;
    void set_enabled(bool enabled) override;
    [[nodiscard]] float mix() const override;
    void set_mix(float mix) override;

    [[nodiscard]] std::vector<std::string> parameter_names() const override;
    [[nodiscard]] std::optional<float> parameter(const std::string& key) const override;
    tonic_core::Result<void> set_parameter(const std::string& key, float value) override;

    void set_sample_rate(std::uint32_t rate) override;

    /// Locks the node, renders the wet signal and blends it with the dry input
    void process(float* samples, std::size_t frames, std::uint32_t channels) final;
    void reset() final;

    [[nodiscard]] std::uint32_t attachment_count() const override { return m_attachments; }
    void on_attached() override { ++m_attachments; }
    void on_detached() override { if (m_attachments > 0) --m_attachments; }

protected:
    EffectNodeBase(EffectKind kind, std::string name);

    /// Declare a parameter with its valid range
    void declare(const std::string& key, float value, float min, float max);
    [[nodiscard]] float param(const std::string& key) const;

    /// Recompute derived state after a parameter or sample-rate change (lock held)
    virtual void on_parameters_changed() {}

    /// Wet processing of one block (lock held)
    virtual void render(float* samples, std::size_t frames, std::uint32_t channels) = 0;

    /// Drop filter history (lock held)
    virtual void clear_state() {}

    void apply_mix(const float* dry, float* wet, std::size_t count) const;

    struct Param {
        float value;
        float min;
        float max;
    };

    EffectKind m_kind;
    std::string m_name;
    bool m_enabled = true;
    float m_mix = 1.0f;
    std::uint32_t m_sample_rate = 44100;
    std::uint32_t m_attachments = 0;
    std::map<std::string, Param> m_params;
    mutable std::mutex m_mutex;
    std::vector<float> m_dry;
};

// =============================================================================
// Filter Node
// =============================================================================

/// Biquad low-pass, high-pass or band-pass filter.
/// Parameters: "frequency" (Hz), "q".
class FilterNode : public EffectNodeBase {
public:
    explicit FilterNode(FilterType type = FilterType::LowPass, float frequency = 1000.0f, float q = 0.707f);

    /// Narrow band-pass around the voice range
    [[nodiscard]] static std::shared_ptr<FilterNode> telephone();

    [[nodiscard]] FilterType filter_type() const;
    void set_filter_type(FilterType type);

protected:
    void on_parameters_changed() override;
    void render(float* samples, std::size_t frames, std::uint32_t channels) override;
    void clear_state() override;

private:
    FilterType m_type;

    float m_b0 = 1, m_b1 = 0, m_b2 = 0;
    float m_a1 = 0, m_a2 = 0;

    std::array<float, 2> m_x1 = {0, 0};
    std::array<float, 2> m_x2 = {0, 0};
    std::array<float, 2> m_y1 = {0, 0};
    std::array<float, 2> m_y2 = {0, 0};
};

// =============================================================================
// Distortion Node
// =============================================================================

/// Soft-clip waveshaper. Parameters: "amount" (0..1).
class DistortionNode : public EffectNodeBase {
public:
    explicit DistortionNode(float amount = 0.0f);

protected:
    void render(float* samples, std::size_t frames, std::uint32_t channels) override;
};

// =============================================================================
// Equalizer Node
// =============================================================================

/// Ten fixed-frequency peaking bands. Parameters: "f32" .. "f16k" (gain dB).
class EqualizerNode : public EffectNodeBase {
public:
    static constexpr std::size_t kBandCount = 10;
    static constexpr std::array<float, kBandCount> kFrequencies = {
        32.0f, 64.0f, 125.0f, 250.0f, 500.0f, 1000.0f, 2000.0f, 4000.0f, 8000.0f, 16000.0f
    };

    EqualizerNode();

    [[nodiscard]] static std::string band_key(std::size_t index);

    tonic_core::Result<void> set_band_gain(std::size_t index, float db);
    [[nodiscard]] float band_gain(std::size_t index) const;

protected:
    void on_parameters_changed() override;
    void render(float* samples, std::size_t frames, std::uint32_t channels) override;
    void clear_state() override;

private:
    struct BandState {
        float b0 = 1, b1 = 0, b2 = 0;
        float a1 = 0, a2 = 0;
        std::array<float, 2> x1 = {0, 0};
        std::array<float, 2> x2 = {0, 0};
        std::array<float, 2> y1 = {0, 0};
        std::array<float, 2> y2 = {0, 0};
    };

    std::array<BandState, kBandCount> m_bands;
};

// =============================================================================
// Stereo Node
// =============================================================================

/// Constant-power panner. Parameters: "pan" (-1 left .. 1 right).
/// Stateless, so it may be shared across chains.
class StereoNode : public EffectNodeBase {
public:
    explicit StereoNode(float pan = 0.0f);

    [[nodiscard]] bool allows_fan_out() const override { return true; }

protected:
    void render(float* samples, std::size_t frames, std::uint32_t channels) override;
};

// =============================================================================
// Compressor Node
// =============================================================================

/// Feed-forward compressor; with a high ratio it acts as the bus limiter.
/// Parameters: "threshold" (dB), "knee" (dB), "ratio", "attack" (s), "release" (s).
class CompressorNode : public EffectNodeBase {
public:
    CompressorNode();

    /// Settings used at the end of the mixing bus
    [[nodiscard]] static std::shared_ptr<CompressorNode> limiter();

    /// Current gain reduction in dB (positive)
    [[nodiscard]] float gain_reduction() const;

protected:
    void render(float* samples, std::size_t frames, std::uint32_t channels) override;
    void clear_state() override;

private:
    float compute_gain(float input_db) const;

    float m_envelope = 0;
    float m_gain_reduction = 0;
};

// =============================================================================
// Factory
// =============================================================================

/// Create a node of the given kind with default parameters
[[nodiscard]] EffectNodePtr create_effect(EffectKind kind);

} // namespace tonic_sound
