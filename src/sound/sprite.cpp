/// @file sprite.cpp
/// @brief SoundSprite implementation

#include <tonic/sound/sprite.hpp>
#include <tonic/sound/asset.hpp>

namespace tonic_sound {

SoundSprite::SoundSprite(SoundAsset& parent, std::string name, const SpriteData& data)
    : m_parent(parent)
    , m_name(std::move(name))
    , m_start(data.start)
    , m_end(data.end)
    , m_speed(data.speed) {}

PlayHandle SoundSprite::play(CompleteCallback complete) {
    PlayOptions options;
    options.sprite = m_name;
    options.complete = std::move(complete);
    return m_parent.play(std::move(options));
}

} // namespace tonic_sound
