/// @file asset.cpp
/// @brief SoundAsset implementation

#include <tonic/sound/asset.hpp>
#include <tonic/sound/buffer.hpp>
#include <tonic/sound/byte_source.hpp>
#include <tonic/sound/context.hpp>
#include <tonic/sound/instance.hpp>
#include <tonic/sound/node_chain.hpp>

#include <algorithm>
#include <cmath>

namespace tonic_sound {

namespace {

tonic_core::Result<void> validate_sprite(const std::string& name, const SpriteData& data) {
    if (!(data.start >= 0.0) || !std::isfinite(data.start)) {
        return tonic_core::Err(tonic_core::ConfigError::invalid_option(
            "sprites." + name + ".start", "must be >= 0"));
    }
    if (!(data.end > data.start) || !std::isfinite(data.end)) {
        return tonic_core::Err(tonic_core::ConfigError::invalid_option(
            "sprites." + name + ".end", "must be greater than start"));
    }
    if (data.speed && !(*data.speed > 0.0f)) {
        return tonic_core::Err(tonic_core::ConfigError::invalid_option(
            "sprites." + name + ".speed", "must be positive"));
    }
    return tonic_core::Ok();
}

} // anonymous namespace

SoundAsset::SoundAsset(MixingContext& context, IByteSource* source, SoundConfig config, std::string label)
    : m_context(context)
    , m_source(source)
    , m_label(label.empty() ? (config.src.empty() ? std::string("<memory>") : config.src) : std::move(label))
    , m_chain(std::make_unique<NodeChain>(context, m_label))
    , m_src(std::move(config.src))
    , m_src_buffer(std::move(config.src_buffer))
    , m_auto_play(config.auto_play)
    , m_preload(config.preload || config.auto_play)
    , m_single_instance(config.single_instance)
    , m_blocking(config.blocking)
    , m_loop(config.loop)
    , m_volume(std::clamp(config.volume, 0.0f, 1.0f))
    , m_speed(config.speed > 0.0f ? config.speed : 1.0f)
    , m_complete(std::move(config.complete))
    , m_alive(std::make_shared<bool>(true))
{
    m_chain->set_gain(m_volume);

    if (!config.sprites.empty()) {
        auto added = add_sprites(config.sprites);
        if (!added) {
            sound_logger()->warn("Sound '{}': sprites ignored: {}", m_label, added.error().message());
        }
    }

    if (m_preload) {
        auto loaded = std::move(config.loaded);
        auto started = begin_preload(loaded);
        if (!started) {
            sound_logger()->warn("Sound '{}' cannot preload: {}", m_label,
                tonic_core::build_error_chain(started.error()));
            if (loaded) {
                loaded(tonic_core::Result<void>(started.error()), *this, nullptr);
            }
        }
    }
}

SoundAsset::~SoundAsset() {
    destroy();
}

// =============================================================================
// Loading
// =============================================================================

bool SoundAsset::is_playable() const {
    return m_loaded && m_buffer != nullptr;
}

tonic_core::Result<void> SoundAsset::begin_preload(LoadedCallback callback) {
    if (m_destroyed) {
        return tonic_core::Err(tonic_core::UsageError::destroyed("Sound '" + m_label + "'"));
    }
    if (m_context.is_destroyed()) {
        return tonic_core::Err(tonic_core::UsageError::destroyed("Mixing context"));
    }
    if (m_src.empty() && m_src_buffer.empty()) {
        return tonic_core::Err(tonic_core::ConfigError::missing_source());
    }
    if (!m_src.empty() && !m_source) {
        return tonic_core::Err(tonic_core::ConfigError::invalid_option("src", "no byte source to resolve '" + m_src + "'"));
    }

    if (callback) {
        m_load_callbacks.push_back(std::move(callback));
    }
    if (m_preloading) {
        return tonic_core::Ok();
    }
    m_preloading = true;

    if (!m_src.empty()) {
        sound_logger()->debug("Sound '{}' fetching {}", m_label, m_src);
        std::weak_ptr<bool> alive = m_alive;
        m_source->fetch(m_src, [this, alive](tonic_core::Result<IByteSource::Bytes> bytes) {
            if (alive.expired()) return;
            if (!bytes) {
                finish_load(tonic_core::Result<void>(bytes.error()), nullptr);
                return;
            }
            m_src_buffer = std::move(bytes).value();
            start_decode();
        });
    } else {
        start_decode();
    }

    return tonic_core::Ok();
}

void SoundAsset::start_decode() {
    std::weak_ptr<bool> alive = m_alive;
    auto queued = m_context.decode(m_src_buffer, [this, alive](tonic_core::Result<BufferPtr> result) {
        if (alive.expired()) return;
        on_decoded(std::move(result));
    });

    if (!queued) {
        finish_load(tonic_core::Result<void>(queued.error()), nullptr);
    }
}

void SoundAsset::on_decoded(tonic_core::Result<BufferPtr> result) {
    if (!result) {
        tonic_core::Error error = result.error();
        if (!m_src.empty()) {
            error.with_context("src", m_src);
        }
        finish_load(tonic_core::Result<void>(std::move(error)), nullptr);
        return;
    }

    m_buffer = std::move(result).value();
    m_loaded = true;
    sound_logger()->debug("Sound '{}' decoded: {:.3f}s, {} ch, {} Hz",
        m_label, m_buffer->duration(), m_buffer->channels(), m_buffer->sample_rate());

    InstancePtr instance;
    LoadedCallback play_loaded;
    std::optional<PlayHandle> pending = std::move(m_pending);
    m_pending.reset();

    if (m_auto_play) {
        PlayOptions options = m_autoplay_options.value_or(PlayOptions{});
        if (!m_autoplay_options) {
            options.complete = m_complete;
        }
        m_autoplay_options.reset();
        play_loaded = std::move(options.loaded);

        PlayHandle handle = spawn(std::move(options));
        instance = handle.instance();
        if (pending) {
            // Continuations may destroy this asset
            std::weak_ptr<bool> alive = m_alive;
            if (handle.is_rejected()) {
                pending->reject(*handle.error());
            } else {
                pending->resolve(instance);
            }
            if (alive.expired()) return;
        }
    }

    std::weak_ptr<bool> alive = m_alive;
    finish_load(tonic_core::Ok(), instance);

    if (play_loaded && !alive.expired()) {
        play_loaded(tonic_core::Ok(), *this, instance);
    }
}

void SoundAsset::finish_load(const tonic_core::Result<void>& result, const InstancePtr& instance) {
    m_preloading = false;

    LoadedCallback play_loaded;
    if (!result) {
        sound_logger()->error("Sound '{}' failed to load: {}", m_label,
            tonic_core::build_error_chain(result.error()));
        if (m_autoplay_options) {
            play_loaded = std::move(m_autoplay_options->loaded);
            m_autoplay_options.reset();
        }
    }

    // Callbacks may destroy this asset
    std::weak_ptr<bool> alive = m_alive;

    if (!result && m_pending) {
        auto pending = std::move(*m_pending);
        m_pending.reset();
        pending.reject(result.error());
        if (alive.expired()) return;
    }

    auto callbacks = std::move(m_load_callbacks);
    m_load_callbacks.clear();
    for (auto& cb : callbacks) {
        cb(result, *this, instance);
        if (alive.expired()) return;
    }

    if (play_loaded) {
        play_loaded(result, *this, nullptr);
    }
}

void SoundAsset::cancel_pending(const std::string& reason) {
    m_autoplay_options.reset();
    if (m_pending) {
        m_pending->reject(tonic_core::LoadError::cancelled(reason));
        m_pending.reset();
    }
}

// =============================================================================
// Playback
// =============================================================================

PlayHandle SoundAsset::play(CompleteCallback complete) {
    PlayOptions options;
    options.complete = std::move(complete);
    return play(std::move(options));
}

PlayHandle SoundAsset::play(const std::string& sprite, CompleteCallback complete) {
    PlayOptions options;
    options.sprite = sprite;
    options.complete = std::move(complete);
    return play(std::move(options));
}

PlayHandle SoundAsset::play(PlayOptions options) {
    if (m_destroyed) {
        return PlayHandle::rejected(tonic_core::UsageError::destroyed("Sound '" + m_label + "'"));
    }
    if (m_context.is_destroyed()) {
        return PlayHandle::rejected(tonic_core::UsageError::destroyed("Mixing context"));
    }

    if (options.sprite) {
        auto it = m_sprites.find(*options.sprite);
        if (it == m_sprites.end()) {
            sound_logger()->warn("Sound '{}': sprite '{}' is not defined", m_label, *options.sprite);
            return PlayHandle::rejected(tonic_core::ConfigError::unknown_sprite(*options.sprite));
        }
        options.start = it->second->start();
        options.end = it->second->end();
        options.speed = it->second->speed();
        options.sprite.reset();
    }

    if (!is_playable()) {
        m_auto_play = true;
        m_autoplay_options = std::move(options);

        if (m_pending) {
            return *m_pending;
        }

        PlayHandle handle;
        m_pending = handle;

        auto started = begin_preload();
        if (!started) {
            m_auto_play = false;
            m_autoplay_options.reset();
            m_pending.reset();
            handle.reject(started.error());
        }
        return handle;
    }

    return spawn(std::move(options));
}

PlayHandle SoundAsset::spawn(PlayOptions options) {
    if (m_blocking) {
        for (const auto& existing : m_instances) {
            if (existing->is_active()) {
                return PlayHandle::resolved(existing);
            }
        }
    }

    if (m_single_instance) {
        auto running = m_instances;
        for (auto it = running.rbegin(); it != running.rend(); ++it) {
            (*it)->stop();
        }
    }

    InstancePtr instance = PlaybackInstance::create(m_context, *m_chain, m_buffer);
    m_instances.push_back(instance);

    CompleteCallback complete = std::move(options.complete);
    // Reap first: complete may destroy this asset
    instance->on_end([this, complete](PlaybackInstance& finished) {
        reap(finished);
        if (complete) {
            complete(*this);
        }
    });
    instance->on_stop([this](PlaybackInstance& stopped) {
        reap(stopped);
    });

    PlayParams params;
    params.start = options.start;
    params.end = options.end;
    params.speed = options.speed.value_or(m_speed);
    params.loop = options.loop.value_or(m_loop);
    params.fade_in = fade_to_seconds(options.fade_in);
    params.fade_out = fade_to_seconds(options.fade_out);

    auto started = instance->play(params);
    if (!started) {
        reap(*instance);
        instance->destroy();
        sound_logger()->warn("Sound '{}' play failed: {}", m_label, started.error().message());
        return PlayHandle::rejected(started.error());
    }

    if (m_paused) {
        instance->set_paused(true);
    }

    return PlayHandle::resolved(instance);
}

void SoundAsset::reap(const PlaybackInstance& instance) {
    m_instances.erase(
        std::remove_if(m_instances.begin(), m_instances.end(),
            [&instance](const InstancePtr& p) { return p.get() == &instance; }),
        m_instances.end());
}

void SoundAsset::stop() {
    if (!is_playable()) {
        m_auto_play = false;
        cancel_pending("stop() before sound '" + m_label + "' was playable");
        return;
    }

    auto running = m_instances;
    for (auto it = running.rbegin(); it != running.rend(); ++it) {
        (*it)->stop();
    }
}

void SoundAsset::pause() {
    set_paused(true);
}

void SoundAsset::resume() {
    set_paused(false);
}

void SoundAsset::set_paused(bool paused) {
    m_paused = paused;
    auto running = m_instances;
    for (auto it = running.rbegin(); it != running.rend(); ++it) {
        (*it)->set_paused(paused);
    }
}

// =============================================================================
// Properties
// =============================================================================

void SoundAsset::set_volume(float volume) {
    m_volume = std::clamp(volume, 0.0f, 1.0f);
    m_chain->set_gain(m_volume);
}

void SoundAsset::set_loop(bool loop) {
    m_loop = loop;
    for (auto& instance : m_instances) {
        instance->set_loop(loop);
    }
}

void SoundAsset::set_speed(float speed) {
    if (speed > 0.0f) {
        m_speed = speed;
    }
}

double SoundAsset::duration() const {
    if (!is_playable()) {
        sound_logger()->warn("Sound '{}' is not loaded, duration unknown", m_label);
        return 0.0;
    }
    return m_buffer->duration();
}

// =============================================================================
// Effects
// =============================================================================

tonic_core::Result<void> SoundAsset::set_effects(std::vector<EffectNodePtr> effects) {
    if (m_destroyed) {
        return tonic_core::Err(tonic_core::UsageError::destroyed("Sound '" + m_label + "'"));
    }
    auto result = m_chain->set_effects(std::move(effects));
    if (!result) {
        sound_logger()->warn("Sound '{}': {}", m_label, result.error().message());
    }
    return result;
}

const std::vector<EffectNodePtr>& SoundAsset::effects() const {
    return m_chain->effects();
}

// =============================================================================
// Sprites
// =============================================================================

tonic_core::Result<SoundSprite*> SoundAsset::add_sprite(const std::string& name, const SpriteData& data) {
    if (m_sprites.find(name) != m_sprites.end()) {
        sound_logger()->warn("Sound '{}': sprite '{}' already defined", m_label, name);
        return tonic_core::Err<SoundSprite*>(tonic_core::UsageError::duplicate_sprite(name));
    }
    auto valid = validate_sprite(name, data);
    if (!valid) {
        return tonic_core::Err<SoundSprite*>(valid.error());
    }

    auto sprite = std::make_unique<SoundSprite>(*this, name, data);
    SoundSprite* ptr = sprite.get();
    m_sprites.emplace(name, std::move(sprite));
    return tonic_core::Ok(ptr);
}

tonic_core::Result<void> SoundAsset::add_sprites(const SpriteMap& sprites) {
    for (const auto& [name, data] : sprites) {
        if (m_sprites.find(name) != m_sprites.end()) {
            return tonic_core::Err(tonic_core::UsageError::duplicate_sprite(name));
        }
        auto valid = validate_sprite(name, data);
        if (!valid) {
            return valid;
        }
    }

    for (const auto& [name, data] : sprites) {
        m_sprites.emplace(name, std::make_unique<SoundSprite>(*this, name, data));
    }
    return tonic_core::Ok();
}

bool SoundAsset::remove_sprite(const std::string& name) {
    return m_sprites.erase(name) > 0;
}

void SoundAsset::remove_all_sprites() {
    m_sprites.clear();
}

const SoundSprite* SoundAsset::sprite(const std::string& name) const {
    auto it = m_sprites.find(name);
    return it != m_sprites.end() ? it->second.get() : nullptr;
}

std::vector<std::string> SoundAsset::sprite_names() const {
    std::vector<std::string> names;
    names.reserve(m_sprites.size());
    for (const auto& [name, sprite] : m_sprites) {
        names.push_back(name);
    }
    return names;
}

// =============================================================================
// Lifecycle
// =============================================================================

void SoundAsset::destroy() {
    if (m_destroyed) return;

    auto running = m_instances;
    for (auto it = running.rbegin(); it != running.rend(); ++it) {
        (*it)->stop();
    }
    m_instances.clear();

    cancel_pending("sound '" + m_label + "' destroyed");
    m_destroyed = true;
    m_alive.reset();
    m_preloading = false;

    m_sprites.clear();
    m_chain->destroy();

    // A load in flight never completes now; settle its waiters as cancelled
    auto callbacks = std::move(m_load_callbacks);
    m_load_callbacks.clear();
    if (!callbacks.empty()) {
        const tonic_core::Result<void> cancelled(
            tonic_core::LoadError::cancelled("sound '" + m_label + "' destroyed while loading"));
        for (auto& cb : callbacks) {
            cb(cancelled, *this, nullptr);
        }
    }
}

} // namespace tonic_sound
