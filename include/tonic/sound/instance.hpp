/// @file instance.hpp
/// @brief One in-flight playback of a sound asset

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "node_chain.hpp"

#include <tonic/core/error.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tonic_sound {

/// Playback of a trimmed window of a buffer. Advances on the context clock
/// while Playing and the context is not paused. Not reusable once it reaches
/// Completed or Stopped; Destroyed follows immediately.
class PlaybackInstance : public std::enable_shared_from_this<PlaybackInstance> {
    struct CreateKey {
        explicit CreateKey() = default;
    };

public:
    using EventFn = std::function<void(PlaybackInstance&)>;
    using ProgressFn = std::function<void(float progress, double duration)>;

    [[nodiscard]] static InstancePtr create(MixingContext& context, NodeChain& chain, BufferPtr buffer);

    /// Use create(); the key keeps construction inside the factory
    PlaybackInstance(CreateKey, MixingContext& context, NodeChain& chain, BufferPtr buffer);

    ~PlaybackInstance();

    PlaybackInstance(const PlaybackInstance&) = delete;
    PlaybackInstance& operator=(const PlaybackInstance&) = delete;

    [[nodiscard]] std::uint64_t id() const { return m_id; }
    [[nodiscard]] InstanceState state() const { return m_state; }

    /// Start output of [start, end). Only valid from Created.
    tonic_core::Result<void> play(const PlayParams& params);

    /// Terminate; emits stop exactly once, then destroys
    void stop();

    /// Suspend or resume without losing the position
    void set_paused(bool paused);
    [[nodiscard]] bool paused() const { return m_state == InstanceState::Paused; }

    /// Playing or Paused
    [[nodiscard]] bool is_active() const;

    [[nodiscard]] float volume() const { return m_volume; }
    void set_volume(float volume);

    [[nodiscard]] float speed() const { return m_speed; }
    void set_speed(float speed);

    [[nodiscard]] bool loop() const { return m_loop; }
    void set_loop(bool loop);

    /// Fraction of the window played, 0..1
    [[nodiscard]] float progress() const;

    /// Current offset into the buffer in seconds
    [[nodiscard]] double position() const { return m_start + m_elapsed; }

    [[nodiscard]] double start() const { return m_start; }
    [[nodiscard]] double end() const { return m_end; }

    /// Wall-clock length of one pass of the window at the current speed
    [[nodiscard]] double duration() const;

    [[nodiscard]] std::uint32_t loop_count() const { return m_loops; }

    // Events
    void on_end(EventFn fn) { m_on_end.push_back(std::move(fn)); }
    void on_stop(EventFn fn) { m_on_stop.push_back(std::move(fn)); }
    void on_pause(EventFn fn) { m_on_pause.push_back(std::move(fn)); }
    void on_resumed(EventFn fn) { m_on_resumed.push_back(std::move(fn)); }
    void on_progress(ProgressFn fn) { m_on_progress.push_back(std::move(fn)); }

    /// Release the voice and clock subscription, clear listeners; idempotent
    void destroy();

private:
    void tick(double dt);
    void complete();

    /// Detach the voice and drop the clock subscription. Runs before the
    /// end and stop events so listeners may destroy the owning chain.
    void release();
    void emit(const std::vector<EventFn>& listeners);
    void emit_progress();

    /// Fade envelope at the current position, times volume
    [[nodiscard]] float current_gain() const;
    void sync_voice();

    std::uint64_t m_id;
    MixingContext& m_context;
    NodeChain& m_chain;
    BufferPtr m_buffer;
    VoicePtr m_voice;
    std::uint64_t m_subscription = 0;

    InstanceState m_state = InstanceState::Created;
    double m_start = 0.0;
    double m_end = 0.0;
    double m_elapsed = 0.0;   ///< Buffer seconds into the current pass
    double m_fade_in = 0.0;
    double m_fade_out = 0.0;
    float m_volume = 1.0f;
    float m_speed = 1.0f;
    bool m_loop = false;
    std::uint32_t m_loops = 0;

    std::vector<EventFn> m_on_end;
    std::vector<EventFn> m_on_stop;
    std::vector<EventFn> m_on_pause;
    std::vector<EventFn> m_on_resumed;
    std::vector<ProgressFn> m_on_progress;
};

} // namespace tonic_sound
