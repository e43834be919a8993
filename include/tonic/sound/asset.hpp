/// @file asset.hpp
/// @brief A decodable sound with its sprites, effect chain and live instances

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "play_handle.hpp"
#include "sprite.hpp"

#include <tonic/core/error.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tonic_sound {

/// Owns its NodeChain, its sprites and every instance it spawned.
/// All methods belong to the control thread.
class SoundAsset {
public:
    /// Starts preloading immediately when config.preload or config.auto_play is set.
    /// source may be null when config.src is empty.
    SoundAsset(MixingContext& context, IByteSource* source, SoundConfig config, std::string label = {});
    ~SoundAsset();

    SoundAsset(const SoundAsset&) = delete;
    SoundAsset& operator=(const SoundAsset&) = delete;

    [[nodiscard]] const std::string& label() const { return m_label; }

    // -------------------------------------------------------------------------
    // Loading
    // -------------------------------------------------------------------------

    /// Acquire (if src is set) and decode. Fails immediately when there is no
    /// source; otherwise callback fires later from the context's update().
    /// A call made while a load is in flight joins that load.
    tonic_core::Result<void> begin_preload(LoadedCallback callback = {});

    [[nodiscard]] bool is_loaded() const { return m_loaded; }
    [[nodiscard]] bool is_playable() const;
    [[nodiscard]] bool is_preloading() const { return m_preloading; }

    [[nodiscard]] const std::string& src() const { return m_src; }
    [[nodiscard]] const std::vector<std::uint8_t>& src_buffer() const { return m_src_buffer; }
    [[nodiscard]] BufferPtr buffer() const { return m_buffer; }

    // -------------------------------------------------------------------------
    // Playback
    // -------------------------------------------------------------------------

    /// Spawn an instance. Before the asset is loaded this returns a pending
    /// handle shared by every play() until the load settles it.
    PlayHandle play(PlayOptions options = {});

    /// Play the whole buffer, calling complete at its natural end
    PlayHandle play(CompleteCallback complete);

    /// Play a named sprite
    PlayHandle play(const std::string& sprite, CompleteCallback complete = {});

    /// Stop every instance (newest first); cancels a pending autoplay when not playable
    void stop();
    void pause();
    void resume();

    [[nodiscard]] bool paused() const { return m_paused; }
    void set_paused(bool paused);

    [[nodiscard]] bool is_playing() const { return !m_instances.empty(); }
    [[nodiscard]] const std::vector<InstancePtr>& instances() const { return m_instances; }

    // -------------------------------------------------------------------------
    // Properties
    // -------------------------------------------------------------------------

    [[nodiscard]] float volume() const { return m_volume; }
    void set_volume(float volume);

    [[nodiscard]] bool loop() const { return m_loop; }
    void set_loop(bool loop);

    /// Default speed for new instances
    [[nodiscard]] float speed() const { return m_speed; }
    void set_speed(float speed);

    [[nodiscard]] bool single_instance() const { return m_single_instance; }
    void set_single_instance(bool value) { m_single_instance = value; }

    [[nodiscard]] bool blocking() const { return m_blocking; }
    void set_blocking(bool value) { m_blocking = value; }

    [[nodiscard]] bool auto_play() const { return m_auto_play; }
    [[nodiscard]] bool preload() const { return m_preload; }

    /// Buffer length in seconds; 0 with a warning when not playable
    [[nodiscard]] double duration() const;

    // -------------------------------------------------------------------------
    // Effects
    // -------------------------------------------------------------------------

    tonic_core::Result<void> set_effects(std::vector<EffectNodePtr> effects);
    [[nodiscard]] const std::vector<EffectNodePtr>& effects() const;
    [[nodiscard]] NodeChain& chain() { return *m_chain; }

    // -------------------------------------------------------------------------
    // Sprites
    // -------------------------------------------------------------------------

    tonic_core::Result<SoundSprite*> add_sprite(const std::string& name, const SpriteData& data);

    /// Validates every entry before adding any
    tonic_core::Result<void> add_sprites(const SpriteMap& sprites);

    bool remove_sprite(const std::string& name);
    void remove_all_sprites();

    [[nodiscard]] const SoundSprite* sprite(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> sprite_names() const;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// Stop every instance, cancel pending play, drop sprites and unwire the chain
    void destroy();
    [[nodiscard]] bool is_destroyed() const { return m_destroyed; }

private:
    void start_decode();
    void on_decoded(tonic_core::Result<BufferPtr> result);
    void finish_load(const tonic_core::Result<void>& result, const InstancePtr& instance);
    void cancel_pending(const std::string& reason);
    PlayHandle spawn(PlayOptions options);
    void reap(const PlaybackInstance& instance);

    MixingContext& m_context;
    IByteSource* m_source;
    std::string m_label;
    std::unique_ptr<NodeChain> m_chain;

    std::string m_src;
    std::vector<std::uint8_t> m_src_buffer;
    BufferPtr m_buffer;

    bool m_loaded = false;
    bool m_preloading = false;
    bool m_auto_play = false;
    bool m_preload = false;
    bool m_single_instance = false;
    bool m_blocking = false;
    bool m_loop = false;
    bool m_paused = false;
    bool m_destroyed = false;
    float m_volume = 1.0f;
    float m_speed = 1.0f;

    CompleteCallback m_complete;
    std::vector<LoadedCallback> m_load_callbacks;

    /// Options captured by play() before the asset was loaded
    std::optional<PlayOptions> m_autoplay_options;
    std::optional<PlayHandle> m_pending;

    std::map<std::string, std::unique_ptr<SoundSprite>> m_sprites;
    std::vector<InstancePtr> m_instances;

    /// Expires on destroy so late load completions are ignored
    std::shared_ptr<bool> m_alive;
};

} // namespace tonic_sound
