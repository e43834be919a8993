/// @file node_chain.cpp
/// @brief Voice rendering and NodeChain wiring

#include <tonic/sound/node_chain.hpp>
#include <tonic/sound/buffer.hpp>
#include <tonic/sound/context.hpp>
#include <tonic/sound/effects.hpp>

#include <algorithm>
#include <cmath>
#include <mutex>

namespace tonic_sound {

namespace {

/// Each node once, in first-seen order
std::vector<IEffectNode*> unique_nodes(const std::vector<EffectNodePtr>& nodes) {
    std::vector<IEffectNode*> out;
    for (const auto& n : nodes) {
        if (n && std::find(out.begin(), out.end(), n.get()) == out.end()) {
            out.push_back(n.get());
        }
    }
    return out;
}

} // anonymous namespace

// =============================================================================
// Voice
// =============================================================================

void Voice::render_into(float* out, std::size_t frames, std::uint32_t channels) {
    if (!active || finished || !buffer || buffer->empty() || end_frame <= start_frame) {
        return;
    }

    const auto last = static_cast<double>(buffer->frame_count() - 1);

    for (std::size_t i = 0; i < frames; ++i) {
        if (cursor >= end_frame) {
            if (!loop) {
                finished = true;
                return;
            }
            cursor = start_frame + std::fmod(cursor - start_frame, end_frame - start_frame);
        }

        // Linear interpolation between neighbouring frames
        const double pos = std::min(cursor, last);
        const auto f0 = static_cast<std::size_t>(pos);
        const auto f1 = std::min(f0 + 1, buffer->frame_count() - 1);
        const auto t = static_cast<float>(pos - static_cast<double>(f0));

        for (std::uint32_t c = 0; c < channels; ++c) {
            const float a = buffer->sample(f0, c);
            const float b = buffer->sample(f1, c);
            out[i * channels + c] += (a + (b - a) * t) * gain;
        }

        cursor += rate;
    }
}

// =============================================================================
// NodeChain
// =============================================================================

NodeChain::NodeChain(MixingContext& context, std::string label)
    : m_context(context)
    , m_label(std::move(label)) {
    m_context.attach_chain(this);
}

NodeChain::~NodeChain() {
    destroy();
}

tonic_core::Result<void> NodeChain::set_effects(std::vector<EffectNodePtr> effects) {
    if (m_destroyed) {
        return tonic_core::Err(tonic_core::UsageError::destroyed("Node chain '" + m_label + "'"));
    }

    std::vector<IEffectNode*> current = unique_nodes(m_wired);
    for (IEffectNode* node : unique_nodes(effects)) {
        const bool ours = std::find(current.begin(), current.end(), node) != current.end();
        const std::uint32_t elsewhere = node->attachment_count() - (ours ? 1u : 0u);
        if (elsewhere > 0 && !node->allows_fan_out()) {
            return tonic_core::Err(tonic_core::UsageError::node_in_use(node->name()));
        }
    }

    // Null entries are skipped rather than wired
    effects.erase(std::remove(effects.begin(), effects.end(), nullptr), effects.end());
    m_effects = std::move(effects);
    apply_topology();
    return tonic_core::Ok();
}

void NodeChain::apply_topology() {
    if (m_destroyed) return;

    std::vector<IEffectNode*> before = unique_nodes(m_wired);
    std::vector<IEffectNode*> after = unique_nodes(m_effects);

    {
        std::lock_guard<std::mutex> lock(m_context.render_mutex());

        for (IEffectNode* node : before) {
            if (std::find(after.begin(), after.end(), node) == after.end()) {
                node->on_detached();
            }
        }
        for (IEffectNode* node : after) {
            if (std::find(before.begin(), before.end(), node) == before.end()) {
                node->on_attached();
                node->set_sample_rate(m_context.sample_rate());
                node->reset();
            }
        }

        m_wired = m_effects;
    }

    sound_logger()->debug("Chain '{}' rewired with {} effect(s)", m_label, m_wired.size());
}

float NodeChain::gain() const {
    std::lock_guard<std::mutex> lock(m_context.render_mutex());
    return m_gain;
}

void NodeChain::set_gain(float gain) {
    std::lock_guard<std::mutex> lock(m_context.render_mutex());
    m_gain = gain;
}

void NodeChain::attach(VoicePtr voice) {
    if (m_destroyed || !voice) return;
    std::lock_guard<std::mutex> lock(m_context.render_mutex());
    m_voices.push_back(std::move(voice));
}

void NodeChain::detach(const VoicePtr& voice) {
    std::lock_guard<std::mutex> lock(m_context.render_mutex());
    m_voices.erase(std::remove(m_voices.begin(), m_voices.end(), voice), m_voices.end());
}

std::size_t NodeChain::voice_count() const {
    std::lock_guard<std::mutex> lock(m_context.render_mutex());
    return m_voices.size();
}

void NodeChain::render(float* out, std::size_t frames, std::uint32_t channels) {
    if (m_destroyed || m_voices.empty()) return;

    const std::size_t count = frames * channels;
    m_scratch.assign(count, 0.0f);

    for (auto& voice : m_voices) {
        voice->render_into(m_scratch.data(), frames, channels);
    }

    for (auto& node : m_wired) {
        node->process(m_scratch.data(), frames, channels);
    }

    for (std::size_t i = 0; i < count; ++i) {
        out[i] += m_scratch[i] * m_gain;
    }
}

void NodeChain::destroy() {
    if (m_destroyed) return;

    m_context.detach_chain(this);

    {
        std::lock_guard<std::mutex> lock(m_context.render_mutex());
        for (IEffectNode* node : unique_nodes(m_wired)) {
            node->on_detached();
        }
        m_wired.clear();
        m_voices.clear();
        m_destroyed = true;
    }
    m_effects.clear();
}

} // namespace tonic_sound
