/// @file library.cpp
/// @brief AssetLibrary implementation

#include <tonic/sound/library.hpp>
#include <tonic/sound/asset.hpp>
#include <tonic/sound/byte_source.hpp>
#include <tonic/sound/context.hpp>
#include <tonic/sound/output.hpp>

#include <tonic/core/log.hpp>

#include <set>

namespace tonic_sound {

namespace {

/// Shared progress of one add_many() call
struct Batch {
    std::size_t remaining = 0;
    std::map<std::string, tonic_core::Result<void>> results;
    AssetLibrary::BatchCallback complete;
};

/// Applies the library's logging settings; returns the context settings
const ContextConfig& configure_library_logging(const LibraryConfig& config) {
    tonic_core::LogConfig logging = config.logging;
    auto level = tonic_core::parse_log_level(config.log_level);
    if (level) {
        logging.level = *level;
    }
    tonic_core::configure_logging(logging);

    if (!level) {
        sound_logger()->warn("Unknown log level '{}', keeping {}", config.log_level,
            tonic_core::log_level_name(logging.level));
    }
    if (auto file = tonic_core::log_file_path()) {
        sound_logger()->info("Logging to {}", file->string());
    }
    return config.context;
}

} // anonymous namespace

AssetLibrary::AssetLibrary(const LibraryConfig& config)
    : m_context(std::make_unique<MixingContext>(configure_library_logging(config), create_output_device(config.device)))
    , m_source(std::make_unique<FileByteSource>(m_context->tasks(), config.asset_root))
{
}

AssetLibrary::AssetLibrary(const ContextConfig& context, std::unique_ptr<IOutputDevice> device,
    std::function<std::unique_ptr<IByteSource>(MixingContext&)> make_source)
    : m_context(std::make_unique<MixingContext>(context, std::move(device)))
{
    if (make_source) {
        m_source = make_source(*m_context);
    }
    if (!m_source) {
        m_source = std::make_unique<FileByteSource>(m_context->tasks());
    }
}

AssetLibrary::~AssetLibrary() {
    close();
}

// =============================================================================
// Registration
// =============================================================================

tonic_core::Result<SoundAsset*> AssetLibrary::add(const std::string& alias, SoundConfig config) {
    if (m_closed) {
        return tonic_core::Err<SoundAsset*>(tonic_core::UsageError::destroyed("Asset library"));
    }
    if (alias.empty()) {
        return tonic_core::Err<SoundAsset*>(tonic_core::ConfigError::invalid_option("alias", "must not be empty"));
    }

    if (remove(alias)) {
        sound_logger()->debug("Alias '{}' replaced", alias);
    }

    auto asset = std::make_unique<SoundAsset>(*m_context, m_source.get(), std::move(config), alias);
    SoundAsset* ptr = asset.get();
    m_assets[alias] = std::move(asset);
    return tonic_core::Ok(ptr);
}

tonic_core::Result<SoundAsset*> AssetLibrary::add(const std::string& alias, const std::string& src) {
    return add(alias, SoundConfig::from_src(src));
}

tonic_core::Result<SoundAsset*> AssetLibrary::add(const std::string& alias, std::vector<std::uint8_t> bytes) {
    return add(alias, SoundConfig::from_bytes(std::move(bytes)));
}

tonic_core::Result<void> AssetLibrary::add_many(
    const Manifest& manifest,
    const SoundConfig& shared,
    LoadedCallback loaded,
    BatchCallback complete)
{
    if (m_closed) {
        return tonic_core::Err(tonic_core::UsageError::destroyed("Asset library"));
    }
    std::set<std::string> seen;
    for (const auto& entry : manifest) {
        if (entry.alias.empty()) {
            return tonic_core::Err(tonic_core::ConfigError::invalid_option("alias", "must not be empty"));
        }
        if (entry.src.empty()) {
            return tonic_core::Err(tonic_core::ConfigError::invalid_option(entry.alias, "src must not be empty"));
        }
        if (!seen.insert(entry.alias).second) {
            return tonic_core::Err(tonic_core::ConfigError::invalid_option(entry.alias, "alias listed twice"));
        }
    }

    auto batch = std::make_shared<Batch>();
    batch->remaining = manifest.size();
    batch->complete = std::move(complete);

    if (manifest.empty()) {
        if (batch->complete) batch->complete(batch->results);
        return tonic_core::Ok();
    }

    for (const auto& entry : manifest) {
        SoundConfig config = entry.overrides.apply(shared);
        config.src = entry.src;
        config.src_buffer.clear();
        config.preload = true;

        const std::string alias = entry.alias;
        config.loaded = [batch, loaded, alias](const tonic_core::Result<void>& result, SoundAsset& asset, InstancePtr instance) {
            if (loaded) {
                loaded(result, asset, instance);
            }
            batch->results.insert_or_assign(alias, result);
            if (batch->remaining > 0 && --batch->remaining == 0 && batch->complete) {
                batch->complete(batch->results);
            }
        };

        auto added = add(entry.alias, std::move(config));
        if (!added) {
            return tonic_core::Err(added.error());
        }
    }

    sound_logger()->info("Registered {} sound(s) from manifest", manifest.size());
    return tonic_core::Ok();
}

bool AssetLibrary::remove(const std::string& alias) {
    auto it = m_assets.find(alias);
    if (it == m_assets.end()) {
        return false;
    }

    // Unregister before destroying so callbacks see a consistent registry
    std::unique_ptr<SoundAsset> asset = std::move(it->second);
    m_assets.erase(it);
    asset->destroy();
    return true;
}

void AssetLibrary::remove_all() {
    auto assets = std::move(m_assets);
    m_assets.clear();
    for (auto& [alias, asset] : assets) {
        asset->destroy();
    }
}

tonic_core::Result<SoundAsset*> AssetLibrary::find(const std::string& alias) const {
    auto it = m_assets.find(alias);
    if (it == m_assets.end()) {
        return tonic_core::Err<SoundAsset*>(tonic_core::ConfigError::unknown_alias(alias));
    }
    return tonic_core::Ok(it->second.get());
}

bool AssetLibrary::exists(const std::string& alias) const {
    return m_assets.find(alias) != m_assets.end();
}

std::vector<std::string> AssetLibrary::aliases() const {
    std::vector<std::string> out;
    out.reserve(m_assets.size());
    for (const auto& [alias, asset] : m_assets) {
        out.push_back(alias);
    }
    return out;
}

// =============================================================================
// Per-alias Playback
// =============================================================================

PlayHandle AssetLibrary::play(const std::string& alias, PlayOptions options) {
    auto asset = find(alias);
    if (!asset) {
        sound_logger()->warn("play: {}", asset.error().message());
        return PlayHandle::rejected(asset.error());
    }
    return (*asset)->play(std::move(options));
}

PlayHandle AssetLibrary::play(const std::string& alias, CompleteCallback complete) {
    PlayOptions options;
    options.complete = std::move(complete);
    return play(alias, std::move(options));
}

tonic_core::Result<void> AssetLibrary::stop(const std::string& alias) {
    auto asset = find(alias);
    if (!asset) return tonic_core::Err(asset.error());
    (*asset)->stop();
    return tonic_core::Ok();
}

tonic_core::Result<void> AssetLibrary::pause(const std::string& alias) {
    auto asset = find(alias);
    if (!asset) return tonic_core::Err(asset.error());
    (*asset)->pause();
    return tonic_core::Ok();
}

tonic_core::Result<void> AssetLibrary::resume(const std::string& alias) {
    auto asset = find(alias);
    if (!asset) return tonic_core::Err(asset.error());
    (*asset)->resume();
    return tonic_core::Ok();
}

tonic_core::Result<float> AssetLibrary::volume(const std::string& alias) const {
    auto asset = find(alias);
    if (!asset) return tonic_core::Err<float>(asset.error());
    return tonic_core::Ok((*asset)->volume());
}

tonic_core::Result<void> AssetLibrary::set_volume(const std::string& alias, float volume) {
    auto asset = find(alias);
    if (!asset) return tonic_core::Err(asset.error());
    (*asset)->set_volume(volume);
    return tonic_core::Ok();
}

tonic_core::Result<double> AssetLibrary::duration(const std::string& alias) const {
    auto asset = find(alias);
    if (!asset) return tonic_core::Err<double>(asset.error());
    return tonic_core::Ok((*asset)->duration());
}

// =============================================================================
// Global
// =============================================================================

void AssetLibrary::pause_all() {
    m_context->set_paused(true);
}

void AssetLibrary::resume_all() {
    m_context->set_paused(false);
}

bool AssetLibrary::toggle_pause_all() {
    return m_context->toggle_pause();
}

void AssetLibrary::stop_all() {
    // Stop listeners may remove aliases
    for (const auto& alias : aliases()) {
        auto it = m_assets.find(alias);
        if (it != m_assets.end()) {
            it->second->stop();
        }
    }
}

void AssetLibrary::mute_all() {
    m_context->set_muted(true);
}

void AssetLibrary::unmute_all() {
    m_context->set_muted(false);
}

bool AssetLibrary::toggle_mute_all() {
    return m_context->toggle_mute();
}

float AssetLibrary::volume_all() const {
    return m_context->volume();
}

void AssetLibrary::set_volume_all(float volume) {
    m_context->set_volume(volume);
}

void AssetLibrary::update(double dt) {
    m_context->update(dt);
}

void AssetLibrary::flush() {
    m_context->flush();
}

void AssetLibrary::close() {
    if (m_closed) return;
    remove_all();
    m_context->destroy();
    m_closed = true;
}

} // namespace tonic_sound
