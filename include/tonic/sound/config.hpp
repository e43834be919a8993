/// @file config.hpp
/// @brief JSON loading of sound, sprite, manifest and library settings

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "library.hpp"

#include <tonic/core/error.hpp>

#include <filesystem>
#include <string>

namespace tonic_sound {

/// {"name": {"start": 0.0, "end": 1.5, "speed": 1.0}, ...}
[[nodiscard]] tonic_core::Result<SpriteMap> sprites_from_json_string(const std::string& json_str);

/// {"src": "...", "preload": true, "autoplay": false, "single_instance": false,
///  "blocking": false, "loop": false, "volume": 1.0, "speed": 1.0, "sprites": {...}}
[[nodiscard]] tonic_core::Result<SoundConfig> sound_config_from_json_string(const std::string& json_str);

/// {"alias": "path/to/file.wav", "other": {"src": "...", "loop": true, ...}}
[[nodiscard]] tonic_core::Result<Manifest> manifest_from_json_string(
    const std::string& json_str,
    const std::string& source_name = "<string>");

[[nodiscard]] tonic_core::Result<Manifest> load_manifest(const std::filesystem::path& path);

/// {"volume": 1.0, "muted": false, "device": "null"|"miniaudio", "sample_rate": 44100,
///  "channels": 2, "period_frames": 512, "async_decode": true, "asset_root": "", "log_level": "info",
///  "log_console": true, "log_directory": "", "log_file": "tonic.log",
///  "log_max_file_size": 5242880, "log_max_files": 3}
/// A non-empty log_directory turns on the rotating file sink.
[[nodiscard]] tonic_core::Result<LibraryConfig> library_config_from_json_string(
    const std::string& json_str,
    const std::string& source_name = "<string>");

[[nodiscard]] tonic_core::Result<LibraryConfig> load_library_config(const std::filesystem::path& path);

} // namespace tonic_sound
