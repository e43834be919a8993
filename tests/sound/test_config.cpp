// tonic_sound JSON configuration tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <tonic/sound/config.hpp>

#include <filesystem>
#include <fstream>

using namespace tonic_sound;
using Catch::Approx;

TEST_CASE("Sprite JSON", "[sound][config]") {
    SECTION("valid map") {
        auto sprites = sprites_from_json_string(R"({
            "intro": {"start": 0.0, "end": 1.5},
            "hit":   {"start": 2, "end": 2.25, "speed": 1.5}
        })");
        REQUIRE(sprites);
        REQUIRE(sprites->size() == 2);
        REQUIRE(sprites->at("intro").end == Approx(1.5));
        REQUIRE_FALSE(sprites->at("intro").speed.has_value());
        REQUIRE(sprites->at("hit").start == Approx(2.0));
        REQUIRE(sprites->at("hit").speed.value() == Approx(1.5f));
    }

    SECTION("missing end") {
        auto sprites = sprites_from_json_string(R"({"intro": {"start": 0.0}})");
        REQUIRE_FALSE(sprites);
        REQUIRE(sprites.error().code() == tonic_core::ErrorCode::ParseError);
    }

    SECTION("wrong field type") {
        auto sprites = sprites_from_json_string(R"({"intro": {"start": "zero", "end": 1}})");
        REQUIRE_FALSE(sprites);
        REQUIRE(sprites.error().code() == tonic_core::ErrorCode::ParseError);
    }

    SECTION("malformed document") {
        auto sprites = sprites_from_json_string("{ not json");
        REQUIRE_FALSE(sprites);
        REQUIRE(sprites.error().code() == tonic_core::ErrorCode::ParseError);
    }
}

TEST_CASE("Sound config JSON", "[sound][config]") {
    SECTION("every field") {
        auto config = sound_config_from_json_string(R"({
            "src": "sfx/boom.wav",
            "preload": true,
            "autoplay": true,
            "single_instance": true,
            "blocking": false,
            "loop": true,
            "volume": 0.5,
            "speed": 2.0,
            "sprites": {"tail": {"start": 1, "end": 2}}
        })");
        REQUIRE(config);
        REQUIRE(config->src == "sfx/boom.wav");
        REQUIRE(config->preload);
        REQUIRE(config->auto_play);
        REQUIRE(config->single_instance);
        REQUIRE_FALSE(config->blocking);
        REQUIRE(config->loop);
        REQUIRE(config->volume == Approx(0.5f));
        REQUIRE(config->speed == Approx(2.0f));
        REQUIRE(config->sprites.count("tail") == 1);
    }

    SECTION("defaults") {
        auto config = sound_config_from_json_string(R"({"src": "a.wav"})");
        REQUIRE(config);
        REQUIRE_FALSE(config->preload);
        REQUIRE_FALSE(config->auto_play);
        REQUIRE(config->volume == Approx(1.0f));
        REQUIRE(config->sprites.empty());
    }

    SECTION("not an object") {
        auto config = sound_config_from_json_string("[1, 2]");
        REQUIRE_FALSE(config);
        REQUIRE(config.error().code() == tonic_core::ErrorCode::ParseError);
    }

    SECTION("boolean given as a number") {
        auto config = sound_config_from_json_string(R"({"loop": 1})");
        REQUIRE_FALSE(config);
        REQUIRE(config.error().code() == tonic_core::ErrorCode::ParseError);
    }
}

TEST_CASE("Manifest JSON", "[sound][config]") {
    SECTION("string and object entries") {
        auto manifest = manifest_from_json_string(R"({
            "click": "ui/click.wav",
            "music": {"src": "music/theme.ogg", "loop": true, "volume": 0.4}
        })");
        REQUIRE(manifest);
        REQUIRE(manifest->size() == 2);

        const auto& click = manifest->at(0);
        REQUIRE(click.alias == "click");
        REQUIRE(click.src == "ui/click.wav");
        REQUIRE_FALSE(click.overrides.loop.has_value());

        const auto& music = manifest->at(1);
        REQUIRE(music.alias == "music");
        REQUIRE(music.src == "music/theme.ogg");
        REQUIRE(music.overrides.loop.value());
        REQUIRE(music.overrides.volume.value() == Approx(0.4f));
    }

    SECTION("object entry without src") {
        auto manifest = manifest_from_json_string(R"({"music": {"loop": true}})");
        REQUIRE_FALSE(manifest);
        REQUIRE(manifest.error().code() == tonic_core::ErrorCode::ParseError);
    }

    SECTION("entry of the wrong kind") {
        auto manifest = manifest_from_json_string(R"({"music": 42})");
        REQUIRE_FALSE(manifest);
        REQUIRE(manifest.error().message().find("music") != std::string::npos);
    }

    SECTION("file on disk") {
        auto path = std::filesystem::temp_directory_path() / "tonic_manifest_test.json";
        {
            std::ofstream out(path);
            out << R"({"click": "click.wav"})";
        }
        auto manifest = load_manifest(path);
        std::filesystem::remove(path);

        REQUIRE(manifest);
        REQUIRE(manifest->size() == 1);
        REQUIRE(manifest->front().src == "click.wav");
    }

    SECTION("missing file") {
        auto manifest = load_manifest("/nonexistent/tonic/manifest.json");
        REQUIRE_FALSE(manifest);
        REQUIRE(manifest.error().code() == tonic_core::ErrorCode::IOError);
    }
}

TEST_CASE("Library config JSON", "[sound][config]") {
    SECTION("defaults from an empty object") {
        auto config = library_config_from_json_string("{}");
        REQUIRE(config);
        REQUIRE(config->device == OutputDeviceKind::Null);
        REQUIRE(config->context.sample_rate == 44100);
        REQUIRE(config->context.channels == 2);
        REQUIRE(config->context.async_decode);
        REQUIRE(config->log_level == "info");
        REQUIRE(config->logging.console_enabled);
        REQUIRE_FALSE(config->logging.file_enabled);
    }

    SECTION("every field") {
        auto config = library_config_from_json_string(R"({
            "volume": 0.8,
            "muted": true,
            "device": "miniaudio",
            "sample_rate": 48000,
            "channels": 1,
            "period_frames": 256,
            "async_decode": false,
            "asset_root": "assets",
            "log_level": "debug",
            "log_console": false,
            "log_directory": "logs",
            "log_file": "player.log",
            "log_max_file_size": 1048576,
            "log_max_files": 5
        })");
        REQUIRE(config);
        REQUIRE(config->context.volume == Approx(0.8f));
        REQUIRE(config->context.muted);
        REQUIRE(config->device == OutputDeviceKind::Miniaudio);
        REQUIRE(config->context.sample_rate == 48000);
        REQUIRE(config->context.channels == 1);
        REQUIRE(config->context.period_frames == 256);
        REQUIRE_FALSE(config->context.async_decode);
        REQUIRE(config->asset_root == "assets");
        REQUIRE(config->log_level == "debug");
        REQUIRE_FALSE(config->logging.console_enabled);
        REQUIRE(config->logging.file_enabled);
        REQUIRE(config->logging.log_directory == "logs");
        REQUIRE(config->logging.file_name == "player.log");
        REQUIRE(config->logging.max_file_size == 1048576);
        REQUIRE(config->logging.max_files == 5);
        REQUIRE(config->logging.level == spdlog::level::debug);
    }

    SECTION("unknown device") {
        auto config = library_config_from_json_string(R"({"device": "alsa"})");
        REQUIRE_FALSE(config);
        REQUIRE(config.error().code() == tonic_core::ErrorCode::ParseError);
    }

    SECTION("out of range values") {
        auto volume = library_config_from_json_string(R"({"volume": 1.5})");
        REQUIRE_FALSE(volume);
        REQUIRE(volume.error().as<tonic_core::ConfigError>()->name == "volume");

        auto channels = library_config_from_json_string(R"({"channels": 6})");
        REQUIRE_FALSE(channels);
        REQUIRE(channels.error().code() == tonic_core::ErrorCode::InvalidArgument);

        auto rate = library_config_from_json_string(R"({"sample_rate": 0})");
        REQUIRE_FALSE(rate);

        auto level = library_config_from_json_string(R"({"log_level": "chatty"})");
        REQUIRE_FALSE(level);
        REQUIRE(level.error().as<tonic_core::ConfigError>()->name == "log_level");

        auto files = library_config_from_json_string(R"({"log_directory": "logs", "log_max_files": 0})");
        REQUIRE_FALSE(files);
        REQUIRE(files.error().as<tonic_core::ConfigError>()->name == "log_file");
    }

    SECTION("negative integers are rejected") {
        auto config = library_config_from_json_string(R"({"channels": -1})");
        REQUIRE_FALSE(config);
        REQUIRE(config.error().code() == tonic_core::ErrorCode::ParseError);
    }
}
