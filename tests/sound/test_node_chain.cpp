// tonic_sound NodeChain and Voice tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "test_support.hpp"

using namespace tonic_sound;
using namespace tonic_test;
using Catch::Approx;

namespace {

VoicePtr make_voice(BufferPtr buffer, double rate = 1.0) {
    auto voice = std::make_shared<Voice>();
    voice->buffer = buffer;
    voice->start_frame = 0.0;
    voice->end_frame = static_cast<double>(buffer->frame_count());
    voice->rate = rate;
    voice->active = true;
    return voice;
}

BufferPtr constant_buffer(float value, std::size_t frames, std::uint32_t channels = 1) {
    return std::make_shared<AudioBuffer>(std::vector<float>(frames * channels, value), channels, 44100);
}

} // anonymous namespace

// =============================================================================
// Voice
// =============================================================================

TEST_CASE("Voice rendering", "[sound][node_chain]") {
    auto buffer = constant_buffer(0.5f, 4);
    std::vector<float> out(8 * 2, 0.0f);

    SECTION("mono buffer fills every channel and adds into the output") {
        auto voice = make_voice(buffer);
        std::fill(out.begin(), out.end(), 0.25f);
        voice->render_into(out.data(), 2, 2);
        REQUIRE(out[0] == Approx(0.75f));
        REQUIRE(out[1] == Approx(0.75f));
    }

    SECTION("non-looping voice finishes at the window end") {
        auto voice = make_voice(buffer);
        voice->render_into(out.data(), 8, 2);
        REQUIRE(voice->finished);
        REQUIRE(out[3 * 2] == Approx(0.5f));
        REQUIRE(out[4 * 2] == Approx(0.0f));
    }

    SECTION("looping voice wraps") {
        auto voice = make_voice(buffer);
        voice->loop = true;
        voice->render_into(out.data(), 8, 2);
        REQUIRE_FALSE(voice->finished);
        REQUIRE(out[7 * 2] == Approx(0.5f));
    }

    SECTION("inactive voice is silent") {
        auto voice = make_voice(buffer);
        voice->active = false;
        voice->render_into(out.data(), 8, 2);
        for (float s : out) REQUIRE(s == 0.0f);
    }

    SECTION("gain scales the output") {
        auto voice = make_voice(buffer);
        voice->gain = 0.5f;
        voice->render_into(out.data(), 1, 2);
        REQUIRE(out[0] == Approx(0.25f));
    }
}

// =============================================================================
// NodeChain
// =============================================================================

TEST_CASE("NodeChain lifecycle", "[sound][node_chain]") {
    SoundFixture fx;
    const std::size_t chains_before = fx.context.chain_count();

    auto chain = std::make_unique<NodeChain>(fx.context, "chain");
    REQUIRE(fx.context.chain_count() == chains_before + 1);
    REQUIRE(chain->label() == "chain");

    SECTION("destroy detaches from the context and is idempotent") {
        chain->destroy();
        chain->destroy();
        REQUIRE(chain->is_destroyed());
        REQUIRE(fx.context.chain_count() == chains_before);
        REQUIRE_FALSE(chain->set_effects({std::make_shared<DistortionNode>()}));
    }

    SECTION("destructor detaches") {
        chain.reset();
        REQUIRE(fx.context.chain_count() == chains_before);
    }

    SECTION("voices attach and detach") {
        auto voice = make_voice(constant_buffer(0.1f, 16));
        chain->attach(voice);
        REQUIRE(chain->voice_count() == 1);
        chain->detach(voice);
        REQUIRE(chain->voice_count() == 0);
    }
}

TEST_CASE("NodeChain effect wiring", "[sound][node_chain]") {
    SoundFixture fx;
    NodeChain a(fx.context, "a");
    NodeChain b(fx.context, "b");

    SECTION("set_effects attaches and replacing detaches") {
        auto filter = std::make_shared<FilterNode>();
        auto distortion = std::make_shared<DistortionNode>();

        REQUIRE(a.set_effects({filter, distortion}));
        REQUIRE(a.effects().size() == 2);
        REQUIRE(filter->attachment_count() == 1);
        REQUIRE(distortion->attachment_count() == 1);

        REQUIRE(a.set_effects({distortion}));
        REQUIRE(filter->attachment_count() == 0);
        REQUIRE(distortion->attachment_count() == 1);

        REQUIRE(a.set_effects({}));
        REQUIRE(distortion->attachment_count() == 0);
    }

    SECTION("re-applying the same list keeps a single attachment") {
        auto filter = std::make_shared<FilterNode>();
        REQUIRE(a.set_effects({filter}));
        REQUIRE(a.set_effects({filter}));
        a.apply_topology();
        REQUIRE(filter->attachment_count() == 1);
    }

    SECTION("a node cannot feed two chains") {
        auto filter = std::make_shared<FilterNode>();
        REQUIRE(a.set_effects({filter}));

        auto result = b.set_effects({filter});
        REQUIRE_FALSE(result);
        REQUIRE(result.error().is<tonic_core::UsageError>());
        REQUIRE(result.error().as<tonic_core::UsageError>()->kind == tonic_core::UsageError::Kind::NodeInUse);
        REQUIRE(b.effects().empty());
        REQUIRE(filter->attachment_count() == 1);
    }

    SECTION("stereo nodes may be shared") {
        auto pan = std::make_shared<StereoNode>(0.5f);
        REQUIRE(a.set_effects({pan}));
        REQUIRE(b.set_effects({pan}));
        REQUIRE(pan->attachment_count() == 2);
    }

    SECTION("null entries are dropped") {
        REQUIRE(a.set_effects({nullptr, std::make_shared<DistortionNode>(), nullptr}));
        REQUIRE(a.effects().size() == 1);
    }

    SECTION("destroy releases the nodes") {
        auto filter = std::make_shared<FilterNode>();
        REQUIRE(a.set_effects({filter}));
        a.destroy();
        REQUIRE(filter->attachment_count() == 0);
        REQUIRE(b.set_effects({filter}));
    }
}

TEST_CASE("NodeChain rendering", "[sound][node_chain]") {
    SoundFixture fx;
    NodeChain chain(fx.context, "render");
    auto voice = make_voice(constant_buffer(0.5f, 64));
    chain.attach(voice);

    std::vector<float> out(16 * 2, 0.0f);

    SECTION("gain stage scales the mix") {
        chain.set_gain(0.5f);
        REQUIRE(chain.gain() == Approx(0.5f));
        chain.render(out.data(), 16, 2);
        REQUIRE(out[0] == Approx(0.25f));
    }

    SECTION("effects run in order between voices and gain") {
        auto pan = std::make_shared<StereoNode>(1.0f);
        REQUIRE(chain.set_effects({pan}));
        chain.render(out.data(), 16, 2);
        REQUIRE(out[0] == Approx(0.0f).margin(1e-6));
        REQUIRE(out[1] == Approx(1.0f));
    }
}
