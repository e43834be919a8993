/// @file sound.hpp
/// @brief Main include header for tonic_sound

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "buffer.hpp"
#include "effects.hpp"
#include "output.hpp"
#include "task_queue.hpp"
#include "byte_source.hpp"
#include "node_chain.hpp"
#include "context.hpp"
#include "play_handle.hpp"
#include "instance.hpp"
#include "sprite.hpp"
#include "asset.hpp"
#include "library.hpp"
#include "config.hpp"

namespace tonic_sound {

/// Prelude - commonly used types
namespace prelude {
    using tonic_sound::AssetLibrary;
    using tonic_sound::SoundAsset;
    using tonic_sound::SoundSprite;
    using tonic_sound::PlaybackInstance;
    using tonic_sound::PlayHandle;
    using tonic_sound::PlayOptions;
    using tonic_sound::SoundConfig;
    using tonic_sound::LibraryConfig;
    using tonic_sound::MixingContext;
    using tonic_sound::InstanceState;
} // namespace prelude

} // namespace tonic_sound
