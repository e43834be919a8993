/// @file null_output.cpp
/// @brief Headless output device

#include <tonic/sound/output.hpp>

namespace tonic_sound {

tonic_core::Result<void> NullOutputDevice::start(const ContextConfig& config, RenderFn render) {
    if (m_running) {
        return tonic_core::Err(tonic_core::Error{tonic_core::ErrorCode::AlreadyExists, "Output device already started"});
    }
    m_render = std::move(render);
    m_sample_rate = config.sample_rate;
    m_channels = config.channels;
    m_running = true;
    return tonic_core::Ok();
}

void NullOutputDevice::stop() {
    m_running = false;
    m_render = nullptr;
}

std::vector<float> NullOutputDevice::pull(std::size_t frames) {
    std::vector<float> out(frames * m_channels, 0.0f);
    if (m_running && m_render) {
        m_render(out.data(), frames, m_channels);
    }
    return out;
}

std::unique_ptr<IOutputDevice> create_output_device(OutputDeviceKind kind) {
    switch (kind) {
        case OutputDeviceKind::Miniaudio: return std::make_unique<MiniaudioOutputDevice>();
        case OutputDeviceKind::Null: break;
    }
    return std::make_unique<NullOutputDevice>();
}

} // namespace tonic_sound
