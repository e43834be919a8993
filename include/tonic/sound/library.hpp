/// @file library.hpp
/// @brief Alias registry of sound assets sharing one mixing context

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "play_handle.hpp"

#include <tonic/core/error.hpp>
#include <tonic/core/log.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tonic_sound {

/// Library-wide settings, usually loaded from JSON
struct LibraryConfig {
    ContextConfig context;
    OutputDeviceKind device = OutputDeviceKind::Null;
    std::string asset_root;          ///< Base directory for relative locators
    std::string log_level = "info";  ///< Overrides logging.level when valid
    tonic_core::LogConfig logging;
};

/// One manifest row: alias -> locator with optional per-entry overrides
struct ManifestEntry {
    std::string alias;
    std::string src;
    SoundOverrides overrides;
};

using Manifest = std::vector<ManifestEntry>;

/// Owns the MixingContext, the byte source and every registered asset.
/// Destroying the library destroys every asset, then the context.
class AssetLibrary {
public:
    /// Fired once after every entry of an add_many() call has finished loading
    using BatchCallback = std::function<void(const std::map<std::string, tonic_core::Result<void>>& results)>;

    /// Configures logging, then builds the context and a FileByteSource
    /// rooted at config.asset_root
    explicit AssetLibrary(const LibraryConfig& config = {});

    /// Use an existing device and byte source factory (tests, embedding)
    AssetLibrary(const ContextConfig& context, std::unique_ptr<IOutputDevice> device,
        std::function<std::unique_ptr<IByteSource>(MixingContext&)> make_source);

    ~AssetLibrary();

    AssetLibrary(const AssetLibrary&) = delete;
    AssetLibrary& operator=(const AssetLibrary&) = delete;

    // -------------------------------------------------------------------------
    // Registration
    // -------------------------------------------------------------------------

    /// Register (or replace) an alias. A replaced asset is destroyed first.
    tonic_core::Result<SoundAsset*> add(const std::string& alias, SoundConfig config);
    tonic_core::Result<SoundAsset*> add(const std::string& alias, const std::string& src);
    tonic_core::Result<SoundAsset*> add(const std::string& alias, std::vector<std::uint8_t> bytes);

    /// Register every manifest entry, always preloading. loaded fires per
    /// asset; complete fires once after the last load attempt settles.
    tonic_core::Result<void> add_many(
        const Manifest& manifest,
        const SoundConfig& shared = {},
        LoadedCallback loaded = {},
        BatchCallback complete = {});

    /// Destroy and unregister; false if the alias was unknown
    bool remove(const std::string& alias);
    void remove_all();

    [[nodiscard]] tonic_core::Result<SoundAsset*> find(const std::string& alias) const;
    [[nodiscard]] bool exists(const std::string& alias) const;
    [[nodiscard]] std::vector<std::string> aliases() const;
    [[nodiscard]] std::size_t size() const { return m_assets.size(); }

    // -------------------------------------------------------------------------
    // Per-alias playback
    // -------------------------------------------------------------------------

    PlayHandle play(const std::string& alias, PlayOptions options = {});
    PlayHandle play(const std::string& alias, CompleteCallback complete);

    tonic_core::Result<void> stop(const std::string& alias);
    tonic_core::Result<void> pause(const std::string& alias);
    tonic_core::Result<void> resume(const std::string& alias);

    [[nodiscard]] tonic_core::Result<float> volume(const std::string& alias) const;
    tonic_core::Result<void> set_volume(const std::string& alias, float volume);

    [[nodiscard]] tonic_core::Result<double> duration(const std::string& alias) const;

    // -------------------------------------------------------------------------
    // Global
    // -------------------------------------------------------------------------

    void pause_all();
    void resume_all();
    bool toggle_pause_all();
    void stop_all();

    void mute_all();
    void unmute_all();
    bool toggle_mute_all();

    [[nodiscard]] float volume_all() const;
    void set_volume_all(float volume);

    /// Drive the context clock and dispatch async completions
    void update(double dt);
    void flush();

    /// Remove every asset and destroy the context; idempotent
    void close();
    [[nodiscard]] bool is_closed() const { return m_closed; }

    [[nodiscard]] MixingContext& context() { return *m_context; }
    [[nodiscard]] IByteSource& byte_source() { return *m_source; }

private:
    std::unique_ptr<MixingContext> m_context;
    std::unique_ptr<IByteSource> m_source;
    std::map<std::string, std::unique_ptr<SoundAsset>> m_assets;
    bool m_closed = false;
};

} // namespace tonic_sound
