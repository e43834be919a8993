/// @file node_chain.hpp
/// @brief Per-asset signal path: voices -> effects -> gain -> mixing bus

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <tonic/core/error.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tonic_sound {

// =============================================================================
// Voice
// =============================================================================

/// Render-side state of one playback. Every field is guarded by the
/// owning context's render lock.
struct Voice {
    BufferPtr buffer;
    double cursor = 0.0;       ///< Position in buffer frames
    double start_frame = 0.0;
    double end_frame = 0.0;    ///< Exclusive
    double rate = 1.0;         ///< Buffer frames consumed per output frame
    bool loop = false;
    float gain = 1.0f;
    bool active = false;       ///< False before start and while paused
    bool finished = false;     ///< Ran off the end of a non-looping window

    /// Mix frames of this voice into out (additive)
    void render_into(float* out, std::size_t frames, std::uint32_t channels);
};

using VoicePtr = std::shared_ptr<Voice>;

// =============================================================================
// Node Chain
// =============================================================================

/// Source stage, ordered effect nodes and a gain stage feeding the context bus.
/// Topology changes and voice attachment take the context render lock, so the
/// render thread never observes a partially rewired chain.
class NodeChain {
public:
    NodeChain(MixingContext& context, std::string label);
    ~NodeChain();

    NodeChain(const NodeChain&) = delete;
    NodeChain& operator=(const NodeChain&) = delete;

    [[nodiscard]] const std::string& label() const { return m_label; }

    /// Replace the effect list and rewire. Fails without changes if a node
    /// that does not allow fan-out is attached to another chain.
    tonic_core::Result<void> set_effects(std::vector<EffectNodePtr> effects);
    [[nodiscard]] const std::vector<EffectNodePtr>& effects() const { return m_effects; }

    /// Disconnect the previous wiring and connect source -> e0 -> ... -> gain
    void apply_topology();

    [[nodiscard]] float gain() const;
    void set_gain(float gain);

    void attach(VoicePtr voice);
    void detach(const VoicePtr& voice);
    [[nodiscard]] std::size_t voice_count() const;

    /// Render all voices through the effects into out (additive). Caller holds the render lock.
    void render(float* out, std::size_t frames, std::uint32_t channels);

    /// Disconnect every stage; idempotent
    void destroy();
    [[nodiscard]] bool is_destroyed() const { return m_destroyed; }

private:
    MixingContext& m_context;
    std::string m_label;

    std::vector<EffectNodePtr> m_effects;  ///< Requested order
    std::vector<EffectNodePtr> m_wired;    ///< Order the render thread uses
    std::vector<VoicePtr> m_voices;
    std::vector<float> m_scratch;
    float m_gain = 1.0f;
    bool m_destroyed = false;
};

} // namespace tonic_sound
