/// @file instance.cpp
/// @brief PlaybackInstance implementation

#include <tonic/sound/instance.hpp>
#include <tonic/sound/buffer.hpp>
#include <tonic/sound/context.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <mutex>

namespace tonic_sound {

namespace {

std::atomic<std::uint64_t> s_next_instance_id{1};

} // anonymous namespace

InstancePtr PlaybackInstance::create(MixingContext& context, NodeChain& chain, BufferPtr buffer) {
    return std::make_shared<PlaybackInstance>(CreateKey{}, context, chain, std::move(buffer));
}

PlaybackInstance::PlaybackInstance(CreateKey, MixingContext& context, NodeChain& chain, BufferPtr buffer)
    : m_id(s_next_instance_id.fetch_add(1))
    , m_context(context)
    , m_chain(chain)
    , m_buffer(std::move(buffer))
    , m_voice(std::make_shared<Voice>()) {}

PlaybackInstance::~PlaybackInstance() {
    destroy();
}

// =============================================================================
// Playback Control
// =============================================================================

tonic_core::Result<void> PlaybackInstance::play(const PlayParams& params) {
    if (m_state == InstanceState::Destroyed) {
        return tonic_core::Err(tonic_core::UsageError::destroyed("Playback instance"));
    }
    if (m_state != InstanceState::Created) {
        return tonic_core::Err(tonic_core::Error{tonic_core::ErrorCode::InvalidState,
            std::string("Playback instance already started (") + to_string(m_state) + ")"});
    }
    if (!m_buffer || m_buffer->empty()) {
        return tonic_core::Err(tonic_core::UsageError::not_playable("Playback instance buffer"));
    }
    if (!(params.speed > 0.0f) || !std::isfinite(params.speed)) {
        return tonic_core::Err(tonic_core::ConfigError::invalid_option("speed", "must be positive"));
    }

    const double length = m_buffer->duration();
    const double start = std::max(0.0, params.start);
    const double end = params.end ? std::min(*params.end, length) : length;
    if (start >= end) {
        return tonic_core::Err(tonic_core::UsageError::invalid_window(start, end));
    }

    m_start = start;
    m_end = end;
    m_elapsed = 0.0;
    m_speed = params.speed;
    m_loop = params.loop;
    m_fade_in = std::max(0.0, params.fade_in);
    m_fade_out = std::clamp(params.fade_out, 0.0, std::max(0.0, duration() - m_fade_in));

    const double rate = static_cast<double>(m_buffer->sample_rate());
    {
        std::lock_guard<std::mutex> lock(m_context.render_mutex());
        m_voice->buffer = m_buffer;
        m_voice->start_frame = m_start * rate;
        m_voice->end_frame = m_end * rate;
        m_voice->cursor = m_voice->start_frame;
        m_voice->rate = m_speed * rate / static_cast<double>(m_context.sample_rate());
        m_voice->loop = m_loop;
        m_voice->gain = current_gain();
        m_voice->active = true;
        m_voice->finished = false;
    }
    m_chain.attach(m_voice);

    std::weak_ptr<PlaybackInstance> weak = weak_from_this();
    m_subscription = m_context.subscribe([weak](double dt) {
        if (auto self = weak.lock()) {
            self->tick(dt);
        }
    });

    m_state = InstanceState::Playing;
    emit_progress();
    return tonic_core::Ok();
}

void PlaybackInstance::stop() {
    if (is_terminal(m_state)) return;

    auto self = shared_from_this();
    m_state = InstanceState::Stopped;
    release();
    emit(m_on_stop);
    destroy();
}

void PlaybackInstance::set_paused(bool paused) {
    if (paused && m_state == InstanceState::Playing) {
        m_state = InstanceState::Paused;
        {
            std::lock_guard<std::mutex> lock(m_context.render_mutex());
            m_voice->active = false;
        }
        emit(m_on_pause);
    } else if (!paused && m_state == InstanceState::Paused) {
        m_state = InstanceState::Playing;
        {
            std::lock_guard<std::mutex> lock(m_context.render_mutex());
            m_voice->active = true;
        }
        emit(m_on_resumed);
    }
}

bool PlaybackInstance::is_active() const {
    return m_state == InstanceState::Playing || m_state == InstanceState::Paused;
}

// =============================================================================
// Properties
// =============================================================================

void PlaybackInstance::set_volume(float volume) {
    m_volume = std::clamp(volume, 0.0f, 1.0f);
    sync_voice();
}

void PlaybackInstance::set_speed(float speed) {
    if (!(speed > 0.0f)) return;
    m_speed = speed;
    if (is_active()) {
        std::lock_guard<std::mutex> lock(m_context.render_mutex());
        m_voice->rate = m_speed * m_buffer->sample_rate() / static_cast<double>(m_context.sample_rate());
    }
}

void PlaybackInstance::set_loop(bool loop) {
    m_loop = loop;
    if (is_active()) {
        std::lock_guard<std::mutex> lock(m_context.render_mutex());
        m_voice->loop = loop;
    }
}

float PlaybackInstance::progress() const {
    const double window = m_end - m_start;
    if (window <= 0.0) return 0.0f;
    return static_cast<float>(std::clamp(m_elapsed / window, 0.0, 1.0));
}

double PlaybackInstance::duration() const {
    return (m_end - m_start) / static_cast<double>(m_speed);
}

// =============================================================================
// Clock
// =============================================================================

void PlaybackInstance::tick(double dt) {
    if (m_state != InstanceState::Playing || dt <= 0.0) return;

    auto self = shared_from_this();
    const double window = m_end - m_start;

    m_elapsed += dt * m_speed;

    if (m_elapsed >= window) {
        if (m_loop) {
            m_elapsed = std::fmod(m_elapsed, window);
            ++m_loops;
        } else {
            m_elapsed = window;
            emit_progress();
            complete();
            return;
        }
    }

    sync_voice();
    emit_progress();
}

void PlaybackInstance::complete() {
    m_state = InstanceState::Completed;
    release();
    emit(m_on_end);
    destroy();
}

float PlaybackInstance::current_gain() const {
    double envelope = 1.0;
    const double played = m_elapsed / m_speed;
    const double remaining = (m_end - m_start - m_elapsed) / m_speed;

    if (m_fade_in > 0.0 && m_loops == 0 && played < m_fade_in) {
        envelope = std::min(envelope, played / m_fade_in);
    }
    if (m_fade_out > 0.0 && !m_loop && remaining < m_fade_out) {
        envelope = std::min(envelope, std::max(0.0, remaining / m_fade_out));
    }
    return m_volume * static_cast<float>(envelope);
}

void PlaybackInstance::sync_voice() {
    if (!is_active()) return;
    std::lock_guard<std::mutex> lock(m_context.render_mutex());
    m_voice->gain = current_gain();
}

// =============================================================================
// Events
// =============================================================================

void PlaybackInstance::emit(const std::vector<EventFn>& listeners) {
    // Listeners may register further listeners or destroy us
    auto snapshot = listeners;
    for (auto& fn : snapshot) {
        if (fn) fn(*this);
    }
}

void PlaybackInstance::emit_progress() {
    auto snapshot = m_on_progress;
    const float p = progress();
    const double d = duration();
    for (auto& fn : snapshot) {
        if (fn) fn(p, d);
    }
}

// =============================================================================
// Lifecycle
// =============================================================================

void PlaybackInstance::release() {
    // Zero until play() wired the voice and subscribed to the clock
    if (m_subscription != 0) {
        {
            std::lock_guard<std::mutex> lock(m_context.render_mutex());
            m_voice->active = false;
        }
        m_context.unsubscribe(m_subscription);
        m_chain.detach(m_voice);
        m_subscription = 0;
    }
}

void PlaybackInstance::destroy() {
    if (m_state == InstanceState::Destroyed) return;

    m_state = InstanceState::Destroyed;
    release();

    m_on_end.clear();
    m_on_stop.clear();
    m_on_pause.clear();
    m_on_resumed.clear();
    m_on_progress.clear();
}

} // namespace tonic_sound
