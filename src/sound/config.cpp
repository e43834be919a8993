/// @file config.cpp
/// @brief JSON configuration parsing for tonic_sound

#include <tonic/sound/config.hpp>
#include <tonic/core/log.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <sstream>
#include <type_traits>

namespace tonic_sound {

namespace {

tonic_core::Error parse_error(const std::string& message) {
    return tonic_core::Error(tonic_core::ErrorCode::ParseError, message);
}

tonic_core::Result<nlohmann::json> parse_document(const std::string& json_str, const std::string& source_name) {
    try {
        return tonic_core::Ok(nlohmann::json::parse(json_str));
    } catch (const nlohmann::json::parse_error& e) {
        return tonic_core::Err<nlohmann::json>(
            parse_error("JSON parse error in " + source_name + ": " + e.what()));
    }
}

tonic_core::Result<std::string> read_text(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return tonic_core::Err<std::string>(
            tonic_core::LoadError::io_failed(path.string(), "cannot open file"));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return tonic_core::Ok(buffer.str());
}

/// Read an optional field of type T; a present field of the wrong type is an error
template<typename T>
tonic_core::Result<bool> read_optional(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) {
        return tonic_core::Ok(false);
    }
    const auto& v = j[key];
    bool ok = false;
    if constexpr (std::is_same_v<T, bool>) {
        ok = v.is_boolean();
    } else if constexpr (std::is_same_v<T, std::string>) {
        ok = v.is_string();
    } else if constexpr (std::is_floating_point_v<T>) {
        ok = v.is_number();
    } else {
        ok = v.is_number_unsigned();
    }
    if (!ok) {
        return tonic_core::Err<bool>(parse_error(std::string("Field '") + key + "' has the wrong type"));
    }
    out = v.get<T>();
    return tonic_core::Ok(true);
}

template<typename T>
tonic_core::Result<bool> read_override(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    T value{};
    auto found = read_optional(j, key, value);
    if (!found) return found;
    if (*found) out = value;
    return found;
}

#define TONIC_TRY_FIELD(expr, T)                                   \
    do {                                                           \
        auto _field = (expr);                                      \
        if (!_field) return tonic_core::Err<T>(_field.error());    \
    } while (0)

tonic_core::Result<SpriteMap> parse_sprites(const nlohmann::json& j) {
    if (!j.is_object()) {
        return tonic_core::Err<SpriteMap>(parse_error("'sprites' must be an object"));
    }

    SpriteMap sprites;
    for (const auto& [name, entry] : j.items()) {
        if (!entry.is_object()) {
            return tonic_core::Err<SpriteMap>(parse_error("Sprite '" + name + "' must be an object"));
        }
        if (!entry.contains("start") || !entry.contains("end")) {
            return tonic_core::Err<SpriteMap>(parse_error("Sprite '" + name + "' needs 'start' and 'end'"));
        }

        SpriteData data;
        TONIC_TRY_FIELD(read_optional(entry, "start", data.start), SpriteMap);
        TONIC_TRY_FIELD(read_optional(entry, "end", data.end), SpriteMap);
        TONIC_TRY_FIELD(read_override(entry, "speed", data.speed), SpriteMap);
        sprites.emplace(name, data);
    }
    return tonic_core::Ok(std::move(sprites));
}

tonic_core::Result<SoundOverrides> parse_overrides(const nlohmann::json& j) {
    SoundOverrides o;
    TONIC_TRY_FIELD(read_override(j, "autoplay", o.auto_play), SoundOverrides);
    TONIC_TRY_FIELD(read_override(j, "single_instance", o.single_instance), SoundOverrides);
    TONIC_TRY_FIELD(read_override(j, "blocking", o.blocking), SoundOverrides);
    TONIC_TRY_FIELD(read_override(j, "loop", o.loop), SoundOverrides);
    TONIC_TRY_FIELD(read_override(j, "volume", o.volume), SoundOverrides);
    TONIC_TRY_FIELD(read_override(j, "speed", o.speed), SoundOverrides);

    if (j.contains("sprites")) {
        auto sprites = parse_sprites(j["sprites"]);
        if (!sprites) return tonic_core::Err<SoundOverrides>(sprites.error());
        o.sprites = std::move(*sprites);
    }
    return tonic_core::Ok(std::move(o));
}

} // anonymous namespace

// =============================================================================
// Sprites and Sound Config
// =============================================================================

tonic_core::Result<SpriteMap> sprites_from_json_string(const std::string& json_str) {
    auto doc = parse_document(json_str, "<sprites>");
    if (!doc) return tonic_core::Err<SpriteMap>(doc.error());
    return parse_sprites(*doc);
}

tonic_core::Result<SoundConfig> sound_config_from_json_string(const std::string& json_str) {
    auto doc = parse_document(json_str, "<sound>");
    if (!doc) return tonic_core::Err<SoundConfig>(doc.error());
    const auto& j = *doc;

    if (!j.is_object()) {
        return tonic_core::Err<SoundConfig>(parse_error("Sound config must be an object"));
    }

    auto overrides = parse_overrides(j);
    if (!overrides) return tonic_core::Err<SoundConfig>(overrides.error());

    SoundConfig config = overrides->apply(SoundConfig{});
    TONIC_TRY_FIELD(read_optional(j, "src", config.src), SoundConfig);
    TONIC_TRY_FIELD(read_optional(j, "preload", config.preload), SoundConfig);
    return tonic_core::Ok(std::move(config));
}

// =============================================================================
// Manifest
// =============================================================================

tonic_core::Result<Manifest> manifest_from_json_string(const std::string& json_str, const std::string& source_name) {
    auto doc = parse_document(json_str, source_name);
    if (!doc) return tonic_core::Err<Manifest>(doc.error());
    const auto& j = *doc;

    if (!j.is_object()) {
        return tonic_core::Err<Manifest>(parse_error("Manifest " + source_name + " must be an object"));
    }

    Manifest manifest;
    for (const auto& [alias, entry] : j.items()) {
        ManifestEntry row;
        row.alias = alias;

        if (entry.is_string()) {
            row.src = entry.get<std::string>();
        } else if (entry.is_object()) {
            if (!entry.contains("src") || !entry["src"].is_string()) {
                return tonic_core::Err<Manifest>(parse_error("Manifest entry '" + alias + "' is missing 'src'"));
            }
            row.src = entry["src"].get<std::string>();
            auto overrides = parse_overrides(entry);
            if (!overrides) {
                return tonic_core::Err<Manifest>(
                    parse_error("Manifest entry '" + alias + "': " + overrides.error().message()));
            }
            row.overrides = std::move(*overrides);
        } else {
            return tonic_core::Err<Manifest>(
                parse_error("Manifest entry '" + alias + "' must be a string or an object"));
        }

        manifest.push_back(std::move(row));
    }

    return tonic_core::Ok(std::move(manifest));
}

tonic_core::Result<Manifest> load_manifest(const std::filesystem::path& path) {
    auto text = read_text(path);
    if (!text) return tonic_core::Err<Manifest>(text.error());
    return manifest_from_json_string(*text, path.string());
}

// =============================================================================
// Library Config
// =============================================================================

tonic_core::Result<LibraryConfig> library_config_from_json_string(const std::string& json_str, const std::string& source_name) {
    auto doc = parse_document(json_str, source_name);
    if (!doc) return tonic_core::Err<LibraryConfig>(doc.error());
    const auto& j = *doc;

    if (!j.is_object()) {
        return tonic_core::Err<LibraryConfig>(parse_error("Library config " + source_name + " must be an object"));
    }

    LibraryConfig config;
    TONIC_TRY_FIELD(read_optional(j, "volume", config.context.volume), LibraryConfig);
    TONIC_TRY_FIELD(read_optional(j, "muted", config.context.muted), LibraryConfig);
    TONIC_TRY_FIELD(read_optional(j, "async_decode", config.context.async_decode), LibraryConfig);
    TONIC_TRY_FIELD(read_optional(j, "sample_rate", config.context.sample_rate), LibraryConfig);
    TONIC_TRY_FIELD(read_optional(j, "channels", config.context.channels), LibraryConfig);
    TONIC_TRY_FIELD(read_optional(j, "period_frames", config.context.period_frames), LibraryConfig);
    TONIC_TRY_FIELD(read_optional(j, "asset_root", config.asset_root), LibraryConfig);
    TONIC_TRY_FIELD(read_optional(j, "log_level", config.log_level), LibraryConfig);
    TONIC_TRY_FIELD(read_optional(j, "log_console", config.logging.console_enabled), LibraryConfig);
    TONIC_TRY_FIELD(read_optional(j, "log_directory", config.logging.log_directory), LibraryConfig);
    TONIC_TRY_FIELD(read_optional(j, "log_file", config.logging.file_name), LibraryConfig);
    TONIC_TRY_FIELD(read_optional(j, "log_max_file_size", config.logging.max_file_size), LibraryConfig);
    TONIC_TRY_FIELD(read_optional(j, "log_max_files", config.logging.max_files), LibraryConfig);
    config.logging.file_enabled = !config.logging.log_directory.empty();

    std::string device = to_string(config.device);
    TONIC_TRY_FIELD(read_optional(j, "device", device), LibraryConfig);
    if (device == "null") {
        config.device = OutputDeviceKind::Null;
    } else if (device == "miniaudio") {
        config.device = OutputDeviceKind::Miniaudio;
    } else {
        return tonic_core::Err<LibraryConfig>(parse_error("Unknown device '" + device + "'"));
    }

    if (config.context.volume < 0.0f || config.context.volume > 1.0f) {
        return tonic_core::Err<LibraryConfig>(
            tonic_core::ConfigError::invalid_option("volume", "must be within [0, 1]"));
    }
    if (config.context.channels == 0 || config.context.channels > 2) {
        return tonic_core::Err<LibraryConfig>(
            tonic_core::ConfigError::invalid_option("channels", "must be 1 or 2"));
    }
    if (config.context.sample_rate == 0) {
        return tonic_core::Err<LibraryConfig>(
            tonic_core::ConfigError::invalid_option("sample_rate", "must be positive"));
    }
    if (config.logging.file_enabled && (config.logging.file_name.empty() || config.logging.max_files == 0)) {
        return tonic_core::Err<LibraryConfig>(
            tonic_core::ConfigError::invalid_option("log_file", "needs a file name and at least one file"));
    }
    if (auto level = tonic_core::parse_log_level(config.log_level)) {
        config.logging.level = *level;
    } else {
        return tonic_core::Err<LibraryConfig>(
            tonic_core::ConfigError::invalid_option("log_level", "unknown level '" + config.log_level + "'"));
    }

    return tonic_core::Ok(std::move(config));
}

tonic_core::Result<LibraryConfig> load_library_config(const std::filesystem::path& path) {
    auto text = read_text(path);
    if (!text) return tonic_core::Err<LibraryConfig>(text.error());
    return library_config_from_json_string(*text, path.string());
}

#undef TONIC_TRY_FIELD

} // namespace tonic_sound
