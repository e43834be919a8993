// tonic_sound MixingContext tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "test_support.hpp"

using namespace tonic_sound;
using namespace tonic_test;
using Catch::Approx;

namespace {

/// Device that always fails to start
class FailingDevice : public IOutputDevice {
public:
    [[nodiscard]] OutputDeviceKind kind() const override { return OutputDeviceKind::Miniaudio; }
    tonic_core::Result<void> start(const ContextConfig&, RenderFn) override {
        return tonic_core::Err(tonic_core::Error(tonic_core::ErrorCode::IOError, "no playback device"));
    }
    void stop() override {}
    [[nodiscard]] bool is_running() const override { return false; }
    [[nodiscard]] std::uint32_t sample_rate() const override { return 0; }
    [[nodiscard]] std::uint32_t channels() const override { return 0; }
};

} // anonymous namespace

// =============================================================================
// Master State
// =============================================================================

TEST_CASE("MixingContext master controls", "[sound][context]") {
    SoundFixture fx;
    auto& ctx = fx.context;

    SECTION("defaults") {
        REQUIRE(ctx.volume() == Approx(1.0f));
        REQUIRE_FALSE(ctx.muted());
        REQUIRE_FALSE(ctx.paused());
        REQUIRE(ctx.sample_rate() == 44100);
        REQUIRE(ctx.channels() == 2);
        REQUIRE(ctx.device()->kind() == OutputDeviceKind::Null);
        REQUIRE(ctx.device()->is_running());
    }

    SECTION("volume is clamped and round-trips") {
        ctx.set_volume(0.3f);
        REQUIRE(ctx.volume() == Approx(0.3f));
        ctx.set_volume(4.0f);
        REQUIRE(ctx.volume() == Approx(1.0f));
        ctx.set_volume(-1.0f);
        REQUIRE(ctx.volume() == Approx(0.0f));
    }

    SECTION("mute silences without touching volume") {
        ctx.set_volume(0.6f);
        ctx.set_muted(true);
        REQUIRE(ctx.output_gain() == Approx(0.0f));
        REQUIRE(ctx.volume() == Approx(0.6f));

        ctx.set_muted(false);
        REQUIRE(ctx.output_gain() == Approx(0.6f));
    }

    SECTION("toggles return the new state") {
        REQUIRE(ctx.toggle_mute());
        REQUIRE_FALSE(ctx.toggle_mute());
        REQUIRE(ctx.toggle_pause());
        REQUIRE(ctx.paused());
        REQUIRE_FALSE(ctx.toggle_pause());
    }

    SECTION("config seeds the initial state") {
        ContextConfig config = deferred_config();
        config.volume = 0.25f;
        config.muted = true;
        config.sample_rate = 22050;
        config.channels = 1;
        MixingContext custom(config);
        REQUIRE(custom.volume() == Approx(0.25f));
        REQUIRE(custom.muted());
        REQUIRE(custom.sample_rate() == 22050);
        REQUIRE(custom.channels() == 1);
    }
}

TEST_CASE("MixingContext falls back to a silent device", "[sound][context]") {
    MixingContext ctx(deferred_config(), std::make_unique<FailingDevice>());
    REQUIRE(ctx.device()->kind() == OutputDeviceKind::Null);
    REQUIRE(ctx.device()->is_running());
    REQUIRE(ctx.sample_rate() == 44100);
}

// =============================================================================
// Clock
// =============================================================================

TEST_CASE("MixingContext clock", "[sound][context]") {
    SoundFixture fx;
    auto& ctx = fx.context;

    double ticked = 0.0;
    auto id = ctx.subscribe([&ticked](double dt) { ticked += dt; });

    SECTION("update advances time and ticks subscribers") {
        ctx.update(0.5);
        ctx.update(0.25);
        REQUIRE(ctx.current_time() == Approx(0.75));
        REQUIRE(ticked == Approx(0.75));
    }

    SECTION("paused clock stands still") {
        ctx.set_paused(true);
        ctx.update(1.0);
        REQUIRE(ctx.current_time() == Approx(0.0));
        REQUIRE(ticked == Approx(0.0));
    }

    SECTION("unsubscribed ticks stop") {
        ctx.unsubscribe(id);
        ctx.update(1.0);
        REQUIRE(ticked == Approx(0.0));
    }

    SECTION("subscriber may unsubscribe another during a tick") {
        MixingContext::SubscriptionId second = 0;
        int second_ticks = 0;
        ctx.subscribe([&ctx, &second](double) { ctx.unsubscribe(second); });
        second = ctx.subscribe([&second_ticks](double) { ++second_ticks; });

        ctx.update(0.1);
        REQUIRE(second_ticks == 0);
    }

    SECTION("non-positive steps only pump") {
        bool pumped = false;
        ctx.tasks().post([&pumped]() { pumped = true; });
        ctx.update(0.0);
        REQUIRE(pumped);
        REQUIRE(ticked == Approx(0.0));
    }
}

// =============================================================================
// Decoding
// =============================================================================

TEST_CASE("MixingContext decode", "[sound][context]") {
    SoundFixture fx;
    auto& ctx = fx.context;

    std::optional<tonic_core::Result<BufferPtr>> decoded;
    auto capture = [&decoded](tonic_core::Result<BufferPtr> result) { decoded = std::move(result); };

    SECTION("callback never runs inside decode") {
        REQUIRE(ctx.decode(make_wav(0.5), capture));
        REQUIRE_FALSE(decoded.has_value());

        ctx.flush();
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->is_ok());
        auto buffer = decoded->value();
        REQUIRE(buffer->sample_rate() == 8000);
        REQUIRE(buffer->channels() == 1);
        REQUIRE(buffer->duration() == Approx(0.5));
    }

    SECTION("stereo input keeps its layout") {
        REQUIRE(ctx.decode(make_wav(0.25, 22050, 2), capture));
        ctx.flush();
        REQUIRE(decoded->is_ok());
        REQUIRE(decoded->value()->channels() == 2);
        REQUIRE(decoded->value()->frame_count() == 5513);
    }

    SECTION("garbage fails with a decode error") {
        REQUIRE(ctx.decode({1, 2, 3, 4, 5, 6, 7, 8}, capture));
        ctx.flush();
        REQUIRE(decoded->is_err());
        REQUIRE(decoded->error().code() == tonic_core::ErrorCode::DecodeError);
        REQUIRE(decoded->error().message().find("Unable to decode file") != std::string::npos);
    }

    SECTION("empty input fails") {
        REQUIRE(ctx.decode({}, capture));
        ctx.flush();
        REQUIRE(decoded->is_err());
    }

    SECTION("destroyed context refuses work") {
        ctx.destroy();
        auto result = ctx.decode(make_wav(0.5), capture);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code() == tonic_core::ErrorCode::InvalidState);
    }
}

TEST_CASE("MixingContext async decode", "[sound][context]") {
    ContextConfig config;
    config.async_decode = true;
    MixingContext ctx(config);

    bool ok = false;
    REQUIRE(ctx.decode(make_wav(0.25), [&ok](tonic_core::Result<BufferPtr> result) { ok = result.is_ok(); }));
    ctx.flush();
    REQUIRE(ok);
}

// =============================================================================
// Bus
// =============================================================================

TEST_CASE("MixingContext render", "[sound][context]") {
    SoundFixture fx;
    auto& ctx = fx.context;
    NodeChain chain(ctx, "bus");

    auto voice = std::make_shared<Voice>();
    voice->buffer = std::make_shared<AudioBuffer>(std::vector<float>(1024, 0.25f), 1, 44100);
    voice->end_frame = 1024.0;
    voice->active = true;
    chain.attach(voice);

    SECTION("chains are mixed into the device output") {
        auto out = fx.device().pull(64);
        REQUIRE(out.size() == 128);
        REQUIRE(out[0] == Approx(0.25f));
        REQUIRE(out[1] == Approx(0.25f));
    }

    SECTION("master volume scales the bus") {
        ctx.set_volume(0.5f);
        auto out = fx.device().pull(64);
        REQUIRE(out[0] == Approx(0.125f));
    }

    SECTION("mute and pause silence the bus") {
        ctx.set_muted(true);
        for (float s : fx.device().pull(64)) REQUIRE(s == 0.0f);

        ctx.set_muted(false);
        ctx.set_paused(true);
        for (float s : fx.device().pull(64)) REQUIRE(s == 0.0f);
    }

    SECTION("output stays within [-1, 1]") {
        NodeChain loud(ctx, "loud");
        auto hot = std::make_shared<Voice>();
        hot->buffer = std::make_shared<AudioBuffer>(std::vector<float>(1024, 3.0f), 1, 44100);
        hot->end_frame = 1024.0;
        hot->active = true;
        loud.attach(hot);

        for (float s : fx.device().pull(256)) {
            REQUIRE(s <= 1.0f);
            REQUIRE(s >= -1.0f);
        }
    }

    SECTION("destroy stops output and drops chains") {
        ctx.destroy();
        ctx.destroy();
        REQUIRE(ctx.is_destroyed());
        REQUIRE(ctx.chain_count() == 0);
        REQUIRE_FALSE(ctx.device()->is_running());
    }
}
