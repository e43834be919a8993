#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for tonic_sound module

#include <cstdint>
#include <memory>

namespace tonic_sound {

// =============================================================================
// Enumerations
// =============================================================================

enum class InstanceState : std::uint8_t;
enum class EffectKind : std::uint8_t;
enum class FilterType : std::uint8_t;
enum class OutputDeviceKind : std::uint8_t;

// =============================================================================
// Data Types
// =============================================================================

struct PlayOptions;
struct PlayParams;
struct SpriteData;
struct SoundConfig;
struct ContextConfig;
struct LibraryConfig;

// =============================================================================
// Classes
// =============================================================================

class AudioBuffer;
class IEffectNode;
class EffectNodeBase;
class FilterNode;
class DistortionNode;
class EqualizerNode;
class StereoNode;
class CompressorNode;
struct Voice;
class NodeChain;
class IOutputDevice;
class NullOutputDevice;
class MiniaudioOutputDevice;
class TaskQueue;
class IByteSource;
class FileByteSource;
class MemoryByteSource;
class MixingContext;
class PlaybackInstance;
class PlayHandle;
class SoundSprite;
class SoundAsset;
class AssetLibrary;

// =============================================================================
// Smart Pointers
// =============================================================================

using BufferPtr = std::shared_ptr<const AudioBuffer>;
using EffectNodePtr = std::shared_ptr<IEffectNode>;
using InstancePtr = std::shared_ptr<PlaybackInstance>;

} // namespace tonic_sound
