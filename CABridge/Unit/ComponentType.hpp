#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "../Host/HostTypes.hpp"

namespace CAB::Unit {

// kAudioUnitType_* top-level component types.
enum class MainType : uint32_t {
    kOutput = static_cast<uint32_t>('auou'),
    kMusicDevice = static_cast<uint32_t>('aumu'),
    kMusicEffect = static_cast<uint32_t>('aumf'),
    kFormatConverter = static_cast<uint32_t>('aufc'),
    kEffect = static_cast<uint32_t>('aufx'),
    kMixer = static_cast<uint32_t>('aumx'),
    kPanner = static_cast<uint32_t>('aupn'),
    kGenerator = static_cast<uint32_t>('augn'),
    kOfflineEffect = static_cast<uint32_t>('auol'),
    kMidiProcessor = static_cast<uint32_t>('aumi'),
};

enum class IOType : uint32_t {
    kGenericOutput = static_cast<uint32_t>('genr'),
    kHalOutput = static_cast<uint32_t>('ahal'),
    kDefaultOutput = static_cast<uint32_t>('def '),
    kSystemOutput = static_cast<uint32_t>('sys '),
    kVoiceProcessingIO = static_cast<uint32_t>('vpio'),
    kRemoteIO = static_cast<uint32_t>('rioc'),
};

enum class MixerType : uint32_t {
    kMultiChannelMixer = static_cast<uint32_t>('mcmx'),
    kStereoMixer = static_cast<uint32_t>('smxr'),
    kMatrixMixer = static_cast<uint32_t>('mxmx'),
    kSpatialMixer = static_cast<uint32_t>('3dem'),
};

enum class EffectType : uint32_t {
    kPeakLimiter = static_cast<uint32_t>('lmtr'),
    kDynamicsProcessor = static_cast<uint32_t>('dcmp'),
    kLowPassFilter = static_cast<uint32_t>('lpas'),
    kHighPassFilter = static_cast<uint32_t>('hpas'),
    kBandPassFilter = static_cast<uint32_t>('bpas'),
    kParametricEQ = static_cast<uint32_t>('pmeq'),
    kDelay = static_cast<uint32_t>('dely'),
    kMatrixReverb = static_cast<uint32_t>('mrev'),
    kPitch = static_cast<uint32_t>('tmpt'),
};

enum class GeneratorType : uint32_t {
    kScheduledSoundPlayer = static_cast<uint32_t>('sspl'),
    kAudioFilePlayer = static_cast<uint32_t>('afpl'),
};

enum class FormatConverterType : uint32_t {
    kAUConverter = static_cast<uint32_t>('conv'),
    kNewTimePitch = static_cast<uint32_t>('nutp'),
    kVarispeed = static_cast<uint32_t>('vari'),
    kMerger = static_cast<uint32_t>('merg'),
    kSplitter = static_cast<uint32_t>('splt'),
};

enum class MusicDeviceType : uint32_t {
    kDLSSynth = static_cast<uint32_t>('dls '),
    kSampler = static_cast<uint32_t>('samp'),
    kMidiSynth = static_cast<uint32_t>('msyn'),
};

/// Component type FourCC plus optional subtype FourCC. An absent subtype
/// searches every subtype of the main type.
struct ComponentType {
    MainType type;
    std::optional<uint32_t> subtype;

    constexpr ComponentType(MainType main) noexcept : type(main) {}
    constexpr ComponentType(MainType main, uint32_t sub) noexcept : type(main), subtype(sub) {}
    constexpr ComponentType(IOType io) noexcept : ComponentType(MainType::kOutput, static_cast<uint32_t>(io)) {}
    constexpr ComponentType(MixerType mixer) noexcept : ComponentType(MainType::kMixer, static_cast<uint32_t>(mixer)) {}
    constexpr ComponentType(EffectType effect) noexcept : ComponentType(MainType::kEffect, static_cast<uint32_t>(effect)) {}
    constexpr ComponentType(GeneratorType gen) noexcept : ComponentType(MainType::kGenerator, static_cast<uint32_t>(gen)) {}
    constexpr ComponentType(FormatConverterType conv) noexcept
        : ComponentType(MainType::kFormatConverter, static_cast<uint32_t>(conv)) {}
    constexpr ComponentType(MusicDeviceType device) noexcept
        : ComponentType(MainType::kMusicDevice, static_cast<uint32_t>(device)) {}

    [[nodiscard]] constexpr uint32_t TypeCode() const noexcept { return static_cast<uint32_t>(type); }

    /// Search description: zero subtype/manufacturer act as wildcards.
    [[nodiscard]] constexpr Host::ComponentDescription ToSearchDescription() const noexcept {
        return Host::ComponentDescription{TypeCode(), subtype.value_or(0), 0, 0, 0};
    }

    friend constexpr bool operator==(const ComponentType&, const ComponentType&) = default;
};

[[nodiscard]] std::string_view ToString(MainType type) noexcept;

} // namespace CAB::Unit
