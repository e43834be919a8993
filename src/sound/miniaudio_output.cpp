/// @file miniaudio_output.cpp
/// @brief Miniaudio playback device for tonic_sound
///
/// This translation unit carries the miniaudio implementation; decoder.cpp
/// uses the same library through its header only.

#ifdef _WIN32
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
#endif

#define MINIAUDIO_IMPLEMENTATION

// Playback and decoding only
#define MA_NO_ENCODING
#define MA_NO_GENERATION

#include <miniaudio.h>

#include <tonic/sound/output.hpp>

#include <atomic>
#include <cstring>

namespace tonic_sound {

struct MiniaudioOutputDevice::Impl {
    ma_device device{};
    ma_device_config device_config{};
    std::atomic<bool> running{false};
    RenderFn render;
};

static void tonic_data_callback(ma_device* pDevice, void* pOutput, const void* /*pInput*/, ma_uint32 frameCount) {
    auto* impl = static_cast<MiniaudioOutputDevice::Impl*>(pDevice->pUserData);
    auto* output = static_cast<float*>(pOutput);
    const std::uint32_t channels = pDevice->playback.channels;

    std::memset(output, 0, static_cast<std::size_t>(frameCount) * channels * sizeof(float));

    if (!impl || !impl->running.load(std::memory_order_acquire) || !impl->render) {
        return;
    }

    impl->render(output, frameCount, channels);
}

MiniaudioOutputDevice::MiniaudioOutputDevice()
    : m_impl(std::make_unique<Impl>()) {}

MiniaudioOutputDevice::~MiniaudioOutputDevice() {
    stop();
}

tonic_core::Result<void> MiniaudioOutputDevice::start(const ContextConfig& config, RenderFn render) {
    if (m_impl->running) {
        return tonic_core::Err(tonic_core::Error{tonic_core::ErrorCode::AlreadyExists, "Output device already started"});
    }

    m_impl->render = std::move(render);

    m_impl->device_config = ma_device_config_init(ma_device_type_playback);
    m_impl->device_config.playback.format = ma_format_f32;
    m_impl->device_config.playback.channels = config.channels;
    m_impl->device_config.sampleRate = config.sample_rate;
    m_impl->device_config.periodSizeInFrames = config.period_frames;
    m_impl->device_config.dataCallback = tonic_data_callback;
    m_impl->device_config.pUserData = m_impl.get();

    if (ma_device_init(nullptr, &m_impl->device_config, &m_impl->device) != MA_SUCCESS) {
        m_impl->render = nullptr;
        return tonic_core::Err(tonic_core::Error{tonic_core::ErrorCode::InvalidState, "Failed to initialize audio device"});
    }

    m_impl->running.store(true, std::memory_order_release);

    if (ma_device_start(&m_impl->device) != MA_SUCCESS) {
        m_impl->running.store(false, std::memory_order_release);
        ma_device_uninit(&m_impl->device);
        m_impl->render = nullptr;
        return tonic_core::Err(tonic_core::Error{tonic_core::ErrorCode::InvalidState, "Failed to start audio device"});
    }

    return tonic_core::Ok();
}

void MiniaudioOutputDevice::stop() {
    if (!m_impl || !m_impl->running.exchange(false)) return;

    ma_device_stop(&m_impl->device);
    ma_device_uninit(&m_impl->device);
    m_impl->render = nullptr;
}

bool MiniaudioOutputDevice::is_running() const {
    return m_impl && m_impl->running.load();
}

std::uint32_t MiniaudioOutputDevice::sample_rate() const {
    return is_running() ? m_impl->device.sampleRate : m_impl->device_config.sampleRate;
}

std::uint32_t MiniaudioOutputDevice::channels() const {
    return is_running() ? m_impl->device.playback.channels : m_impl->device_config.playback.channels;
}

} // namespace tonic_sound
