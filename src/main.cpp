/// @file main.cpp
/// @brief tonic_play - plays one alias of a sound manifest on the system output
///
/// Loads a JSON manifest into an AssetLibrary backed by the miniaudio device,
/// starts the requested alias (optionally a sprite of it) and drives the
/// session clock until the playback ends or the time limit runs out.

#include <tonic/sound/sound.hpp>
#include <tonic/core/log.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct PlayerOptions {
    fs::path manifest_path;
    std::string alias;
    std::string sprite;
    fs::path config_path;
    std::string log_dir;
    bool loop = false;
    double max_seconds = 0.0;   ///< 0 = until the sound ends
    float volume = 1.0f;
};

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS] MANIFEST ALIAS\n"
              << "\n"
              << "Arguments:\n"
              << "  MANIFEST        JSON object mapping aliases to sound files\n"
              << "  ALIAS           Alias to play\n"
              << "\n"
              << "Options:\n"
              << "  --sprite NAME   Play a named sprite of the sound\n"
              << "  --loop          Loop until the time limit (or Ctrl+C)\n"
              << "  --seconds N     Stop after N seconds\n"
              << "  --volume V      Master volume (0..1)\n"
              << "  --config FILE   Library settings (JSON)\n"
              << "  --log-dir DIR   Also write a rotating log file to DIR\n"
              << "  --help, -h      Show this help message\n"
              << "  --version, -v   Show version information\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " sounds.json click\n"
              << "  " << program_name << " --sprite intro --seconds 5 sounds.json music\n";
}

void print_version() {
    std::cout << "tonic_play 0.1.0\n"
              << "tonic sound playback engine\n";
}

/// Returns 0 to continue, otherwise the process exit code + 1
int parse_arguments(int argc, char** argv, PlayerOptions& options) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 1;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return 1;
        } else if (arg == "--loop") {
            options.loop = true;
        } else if (arg == "--sprite") {
            const char* value = next_value("--sprite");
            if (!value) return 2;
            options.sprite = value;
        } else if (arg == "--config") {
            const char* value = next_value("--config");
            if (!value) return 2;
            options.config_path = value;
        } else if (arg == "--log-dir") {
            const char* value = next_value("--log-dir");
            if (!value) return 2;
            options.log_dir = value;
        } else if (arg == "--seconds" || arg == "--volume") {
            const char* value = next_value(arg.c_str());
            if (!value) return 2;
            try {
                if (arg == "--seconds") {
                    options.max_seconds = std::stod(value);
                } else {
                    options.volume = std::stof(value);
                }
            } catch (const std::exception&) {
                std::cerr << "Invalid number for " << arg << ": " << value << "\n";
                return 2;
            }
        } else if (!arg.empty() && arg[0] != '-') {
            positional.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    if (positional.size() != 2) {
        std::cerr << "Error: expected MANIFEST and ALIAS.\n\n";
        print_usage(argv[0]);
        return 2;
    }

    options.manifest_path = positional[0];
    options.alias = positional[1];
    return 0;
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    tonic_core::init_logging();

    PlayerOptions options;
    if (int code = parse_arguments(argc, argv, options); code != 0) {
        return code - 1;
    }

    tonic_sound::LibraryConfig library_config;
    if (!options.config_path.empty()) {
        auto loaded = tonic_sound::load_library_config(options.config_path);
        if (!loaded) {
            TONIC_LOG_ERROR("Failed to load config: {}", tonic_core::build_error_chain(loaded.error()));
            return 1;
        }
        library_config = std::move(*loaded);
    } else {
        library_config.device = tonic_sound::OutputDeviceKind::Miniaudio;
    }
    if (!options.log_dir.empty()) {
        library_config.logging.file_enabled = true;
        library_config.logging.log_directory = options.log_dir;
    }
    if (library_config.asset_root.empty()) {
        library_config.asset_root = options.manifest_path.parent_path().string();
    }

    auto manifest = tonic_sound::load_manifest(options.manifest_path);
    if (!manifest) {
        TONIC_LOG_ERROR("Failed to load manifest: {}", tonic_core::build_error_chain(manifest.error()));
        return 1;
    }

    tonic_sound::AssetLibrary library(library_config);
    library.set_volume_all(options.volume);

    bool failed = false;
    auto registered = library.add_many(*manifest, {}, {},
        [](const std::map<std::string, tonic_core::Result<void>>& results) {
            for (const auto& [alias, result] : results) {
                if (!result) {
                    TONIC_LOG_WARN("'{}' failed to load: {}", alias, result.error().message());
                }
            }
        });
    if (!registered) {
        TONIC_LOG_ERROR("Manifest rejected: {}", tonic_core::build_error_chain(registered.error()));
        tonic_core::flush_all_loggers();
        return 1;
    }
    if (!library.exists(options.alias)) {
        TONIC_LOG_ERROR("Alias '{}' is not in {}", options.alias, options.manifest_path.string());
        tonic_core::flush_all_loggers();
        return 1;
    }

    tonic_sound::PlayOptions play;
    if (!options.sprite.empty()) {
        play.sprite = options.sprite;
    }
    if (options.loop) {
        play.loop = true;
    }

    bool finished = false;
    play.complete = [&finished](tonic_sound::SoundAsset&) { finished = true; };

    auto handle = library.play(options.alias, std::move(play));
    handle.then(
        [&finished, &options](const tonic_sound::InstancePtr& instance) {
            TONIC_LOG_INFO("Playing '{}' ({:.2f}s)", options.alias, instance->duration());
            instance->on_stop([&finished](tonic_sound::PlaybackInstance&) { finished = true; });
        },
        [&failed](const tonic_core::Error& error) {
            TONIC_LOG_ERROR("Cannot play: {}", tonic_core::build_error_chain(error));
            failed = true;
        });

    constexpr auto kTick = std::chrono::milliseconds(10);
    auto last = std::chrono::steady_clock::now();
    double elapsed = 0.0;

    while (!finished && !failed) {
        std::this_thread::sleep_for(kTick);
        auto now = std::chrono::steady_clock::now();
        double dt = std::chrono::duration<double>(now - last).count();
        last = now;

        library.update(dt);
        elapsed += dt;

        if (options.max_seconds > 0.0 && elapsed >= options.max_seconds) {
            TONIC_LOG_INFO("Time limit reached");
            library.stop_all();
            break;
        }
    }

    library.close();
    tonic_core::shutdown_logging();
    return failed ? 1 : 0;
}
