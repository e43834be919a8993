/// @file sprite.hpp
/// @brief Named sub-range of an asset's buffer

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "play_handle.hpp"

#include <optional>
#include <string>

namespace tonic_sound {

/// Read-only window [start, end) with an optional speed override.
/// Owned by its parent asset.
class SoundSprite {
public:
    SoundSprite(SoundAsset& parent, std::string name, const SpriteData& data);

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] double start() const { return m_start; }
    [[nodiscard]] double end() const { return m_end; }
    [[nodiscard]] const std::optional<float>& speed() const { return m_speed; }

    /// Window length in seconds
    [[nodiscard]] double duration() const { return m_end - m_start; }

    [[nodiscard]] SpriteData data() const { return SpriteData{m_start, m_end, m_speed}; }

    /// Play this window on the parent asset
    PlayHandle play(CompleteCallback complete = {});

private:
    SoundAsset& m_parent;
    std::string m_name;
    double m_start;
    double m_end;
    std::optional<float> m_speed;
};

} // namespace tonic_sound
