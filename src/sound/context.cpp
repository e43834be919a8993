/// @file context.cpp
/// @brief MixingContext implementation

#include <tonic/sound/context.hpp>
#include <tonic/sound/buffer.hpp>
#include <tonic/sound/effects.hpp>
#include <tonic/sound/node_chain.hpp>
#include <tonic/sound/output.hpp>

#include <algorithm>
#include <cstring>

namespace tonic_sound {

MixingContext::MixingContext(ContextConfig config, std::unique_ptr<IOutputDevice> device)
    : m_config(config)
    , m_device(std::move(device))
    , m_limiter(CompressorNode::limiter())
    , m_tasks(config.async_decode ? TaskQueue::Mode::Threaded : TaskQueue::Mode::Deferred)
    , m_volume(std::clamp(config.volume, 0.0f, 1.0f))
    , m_muted(config.muted)
{
    if (!m_device) {
        m_device = std::make_unique<NullOutputDevice>();
    }

    auto render_fn = [this](float* out, std::size_t frames, std::uint32_t channels) {
        render(out, frames, channels);
    };

    auto started = m_device->start(m_config, render_fn);
    if (!started) {
        sound_logger()->error("Output device '{}' unavailable, continuing silent: {}",
            to_string(m_device->kind()), tonic_core::build_error_chain(started.error()));
        m_device = std::make_unique<NullOutputDevice>();
        auto fallback = m_device->start(m_config, render_fn);
        if (!fallback) {
            sound_logger()->error("Null output device failed to start: {}", fallback.error().message());
        }
    }

    m_sample_rate = m_device->sample_rate();
    m_channels = m_device->channels();
    m_limiter->set_sample_rate(m_sample_rate);

    sound_logger()->info("Mixing context ready ({} device, {} Hz, {} ch, {} decode)",
        to_string(m_device->kind()), m_sample_rate, m_channels,
        config.async_decode ? "async" : "deferred");
}

MixingContext::~MixingContext() {
    destroy();
}

// =============================================================================
// Decoding
// =============================================================================

tonic_core::Result<void> MixingContext::decode(std::vector<std::uint8_t> bytes, DecodeCallback callback) {
    if (m_destroyed) {
        return tonic_core::Err(tonic_core::UsageError::destroyed("Mixing context"));
    }

    m_tasks.run_async([bytes = std::move(bytes), callback = std::move(callback)]() -> TaskQueue::Completion {
        auto result = decode_audio(bytes);
        if (!callback) {
            return nullptr;
        }
        return [callback, result = std::move(result)]() mutable {
            callback(std::move(result));
        };
    });

    return tonic_core::Ok();
}

// =============================================================================
// Master State
// =============================================================================

float MixingContext::volume() const {
    std::lock_guard<std::mutex> lock(m_render_mutex);
    return m_volume;
}

void MixingContext::set_volume(float volume) {
    std::lock_guard<std::mutex> lock(m_render_mutex);
    m_volume = std::clamp(volume, 0.0f, 1.0f);
}

bool MixingContext::muted() const {
    std::lock_guard<std::mutex> lock(m_render_mutex);
    return m_muted;
}

void MixingContext::set_muted(bool muted) {
    std::lock_guard<std::mutex> lock(m_render_mutex);
    m_muted = muted;
}

bool MixingContext::toggle_mute() {
    std::lock_guard<std::mutex> lock(m_render_mutex);
    m_muted = !m_muted;
    return m_muted;
}

void MixingContext::set_paused(bool paused) {
    std::lock_guard<std::mutex> lock(m_render_mutex);
    m_paused = paused;
}

bool MixingContext::toggle_pause() {
    set_paused(!m_paused);
    return m_paused;
}

float MixingContext::output_gain() const {
    std::lock_guard<std::mutex> lock(m_render_mutex);
    return m_muted ? 0.0f : m_volume;
}

// =============================================================================
// Clock
// =============================================================================

void MixingContext::update(double dt) {
    if (m_destroyed) return;

    m_tasks.pump();

    if (m_paused || dt <= 0.0) return;

    m_time += dt;

    // Subscribers may unsubscribe themselves or others while being ticked
    std::vector<SubscriptionId> ids;
    ids.reserve(m_subscribers.size());
    for (const auto& [id, fn] : m_subscribers) {
        ids.push_back(id);
    }

    for (SubscriptionId id : ids) {
        auto it = m_subscribers.find(id);
        if (it == m_subscribers.end()) continue;
        TickFn tick = it->second;
        tick(dt);
    }
}

void MixingContext::flush() {
    if (m_destroyed) return;
    m_tasks.flush();
}

MixingContext::SubscriptionId MixingContext::subscribe(TickFn tick) {
    SubscriptionId id = m_next_subscription++;
    m_subscribers.emplace(id, std::move(tick));
    return id;
}

void MixingContext::unsubscribe(SubscriptionId id) {
    m_subscribers.erase(id);
}

// =============================================================================
// Bus
// =============================================================================

void MixingContext::attach_chain(NodeChain* chain) {
    std::lock_guard<std::mutex> lock(m_render_mutex);
    if (m_destroyed) return;
    if (std::find(m_chains.begin(), m_chains.end(), chain) == m_chains.end()) {
        m_chains.push_back(chain);
    }
}

void MixingContext::detach_chain(NodeChain* chain) {
    std::lock_guard<std::mutex> lock(m_render_mutex);
    m_chains.erase(std::remove(m_chains.begin(), m_chains.end(), chain), m_chains.end());
}

std::size_t MixingContext::chain_count() const {
    std::lock_guard<std::mutex> lock(m_render_mutex);
    return m_chains.size();
}

void MixingContext::render(float* out, std::size_t frames, std::uint32_t channels) {
    const std::size_t count = frames * channels;
    std::memset(out, 0, count * sizeof(float));

    std::lock_guard<std::mutex> lock(m_render_mutex);

    if (m_destroyed || m_paused) return;

    for (NodeChain* chain : m_chains) {
        chain->render(out, frames, channels);
    }

    const float gain = m_muted ? 0.0f : m_volume;
    for (std::size_t i = 0; i < count; ++i) {
        out[i] *= gain;
    }

    m_limiter->process(out, frames, channels);

    for (std::size_t i = 0; i < count; ++i) {
        out[i] = std::clamp(out[i], -1.0f, 1.0f);
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void MixingContext::destroy() {
    if (m_destroyed) return;

    if (m_device) {
        m_device->stop();
    }

    m_tasks.clear();

    {
        std::lock_guard<std::mutex> lock(m_render_mutex);
        m_chains.clear();
        m_destroyed = true;
    }
    m_subscribers.clear();

    sound_logger()->info("Mixing context destroyed");
}

} // namespace tonic_sound
