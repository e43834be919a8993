/// @file context.hpp
/// @brief Shared mixing context: master gain, limiter, mute/pause, decoding and clock

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "task_queue.hpp"

#include <tonic/core/error.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace tonic_sound {

/// One per session. Owns the output device, the bus limiter and the task queue
/// that brings off-thread results back to the control thread. All methods
/// except render() belong to the control thread.
class MixingContext {
public:
    using DecodeCallback = std::function<void(tonic_core::Result<BufferPtr>)>;
    using TickFn = std::function<void(double dt)>;
    using SubscriptionId = std::uint64_t;

    /// A null device is used when none is given
    explicit MixingContext(ContextConfig config = {}, std::unique_ptr<IOutputDevice> device = nullptr);
    ~MixingContext();

    MixingContext(const MixingContext&) = delete;
    MixingContext& operator=(const MixingContext&) = delete;

    // -------------------------------------------------------------------------
    // Decoding
    // -------------------------------------------------------------------------

    /// Decode bytes off the caller's stack. The callback runs from update() or
    /// flush(), never from inside this call.
    tonic_core::Result<void> decode(std::vector<std::uint8_t> bytes, DecodeCallback callback);

    // -------------------------------------------------------------------------
    // Master state
    // -------------------------------------------------------------------------

    [[nodiscard]] float volume() const;
    void set_volume(float volume);

    [[nodiscard]] bool muted() const;
    void set_muted(bool muted);
    bool toggle_mute();

    [[nodiscard]] bool paused() const { return m_paused; }
    void set_paused(bool paused);
    bool toggle_pause();

    /// Gain applied at the bus: 0 when muted, otherwise volume
    [[nodiscard]] float output_gain() const;

    // -------------------------------------------------------------------------
    // Clock
    // -------------------------------------------------------------------------

    /// Dispatch finished async work, advance the clock and tick subscribers.
    /// The clock and subscribers stand still while paused.
    void update(double dt);

    /// Block until every queued or in-flight task has been dispatched
    void flush();

    [[nodiscard]] double current_time() const { return m_time; }

    SubscriptionId subscribe(TickFn tick);
    void unsubscribe(SubscriptionId id);

    [[nodiscard]] TaskQueue& tasks() { return m_tasks; }

    // -------------------------------------------------------------------------
    // Bus
    // -------------------------------------------------------------------------

    void attach_chain(NodeChain* chain);
    void detach_chain(NodeChain* chain);
    [[nodiscard]] std::size_t chain_count() const;

    /// Mix every chain into out, then master gain, limiter and clamp.
    /// Called from the output device thread.
    void render(float* out, std::size_t frames, std::uint32_t channels);

    /// Guards the bus, every chain's wiring and every voice
    [[nodiscard]] std::mutex& render_mutex() const { return m_render_mutex; }

    [[nodiscard]] std::uint32_t sample_rate() const { return m_sample_rate; }
    [[nodiscard]] std::uint32_t channels() const { return m_channels; }
    [[nodiscard]] CompressorNode& limiter() { return *m_limiter; }
    [[nodiscard]] IOutputDevice* device() { return m_device.get(); }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// Stop output, disconnect every chain and drop queued completions. Idempotent.
    void destroy();
    [[nodiscard]] bool is_destroyed() const { return m_destroyed; }

private:
    ContextConfig m_config;
    std::unique_ptr<IOutputDevice> m_device;
    std::shared_ptr<CompressorNode> m_limiter;
    TaskQueue m_tasks;

    mutable std::mutex m_render_mutex;
    std::vector<NodeChain*> m_chains;
    float m_volume = 1.0f;
    bool m_muted = false;
    bool m_paused = false;
    bool m_destroyed = false;

    std::uint32_t m_sample_rate = 44100;
    std::uint32_t m_channels = 2;

    double m_time = 0.0;
    SubscriptionId m_next_subscription = 1;
    std::map<SubscriptionId, TickFn> m_subscribers;
};

} // namespace tonic_sound
