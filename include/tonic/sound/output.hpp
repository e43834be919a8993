/// @file output.hpp
/// @brief Output devices that pull the mixing bus

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <tonic/core/error.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace tonic_sound {

// =============================================================================
// Output Device Interface
// =============================================================================

/// Pulls rendered frames from the mixing context
class IOutputDevice {
public:
    /// Fills out with frames * channels interleaved samples
    using RenderFn = std::function<void(float* out, std::size_t frames, std::uint32_t channels)>;

    virtual ~IOutputDevice() = default;

    [[nodiscard]] virtual OutputDeviceKind kind() const = 0;

    virtual tonic_core::Result<void> start(const ContextConfig& config, RenderFn render) = 0;
    virtual void stop() = 0;
    [[nodiscard]] virtual bool is_running() const = 0;

    /// Actual rate and channel count once started
    [[nodiscard]] virtual std::uint32_t sample_rate() const = 0;
    [[nodiscard]] virtual std::uint32_t channels() const = 0;
};

// =============================================================================
// Null Output Device
// =============================================================================

/// Device with no hardware behind it; rendering happens only through pull()
class NullOutputDevice : public IOutputDevice {
public:
    [[nodiscard]] OutputDeviceKind kind() const override { return OutputDeviceKind::Null; }

    tonic_core::Result<void> start(const ContextConfig& config, RenderFn render) override;
    void stop() override;
    [[nodiscard]] bool is_running() const override { return m_running; }

    [[nodiscard]] std::uint32_t sample_rate() const override { return m_sample_rate; }
    [[nodiscard]] std::uint32_t channels() const override { return m_channels; }

    /// Render frames synchronously, as a hardware callback would
    std::vector<float> pull(std::size_t frames);

private:
    RenderFn m_render;
    bool m_running = false;
    std::uint32_t m_sample_rate = 44100;
    std::uint32_t m_channels = 2;
};

// =============================================================================
// Miniaudio Output Device
// =============================================================================

/// System playback device driven by a miniaudio callback thread
class MiniaudioOutputDevice : public IOutputDevice {
public:
    MiniaudioOutputDevice();
    ~MiniaudioOutputDevice() override;

    MiniaudioOutputDevice(const MiniaudioOutputDevice&) = delete;
    MiniaudioOutputDevice& operator=(const MiniaudioOutputDevice&) = delete;

    [[nodiscard]] OutputDeviceKind kind() const override { return OutputDeviceKind::Miniaudio; }

    tonic_core::Result<void> start(const ContextConfig& config, RenderFn render) override;
    void stop() override;
    [[nodiscard]] bool is_running() const override;

    [[nodiscard]] std::uint32_t sample_rate() const override;
    [[nodiscard]] std::uint32_t channels() const override;

    struct Impl;

private:
    std::unique_ptr<Impl> m_impl;
};

/// Create a device of the given kind
[[nodiscard]] std::unique_ptr<IOutputDevice> create_output_device(OutputDeviceKind kind);

} // namespace tonic_sound
