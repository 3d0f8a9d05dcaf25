#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "../Format/SampleFormat.hpp"
#include "../Format/StreamFormat.hpp"
#include "PropertySource.hpp"

namespace CAB::Config {

constexpr double kDefaultSampleRate = 48000.0;
constexpr double kMinSampleRate = 8000.0;
constexpr double kMaxSampleRate = 384000.0;
constexpr uint32_t kDefaultChannelCount = 2;
constexpr uint32_t kMaxChannelCount = 64;
constexpr uint32_t kDefaultBufferCount = 3;
constexpr uint32_t kMaxBufferCount = 64;
constexpr uint32_t kDefaultFramesPerBuffer = 512;
constexpr uint32_t kMaxFramesPerBuffer = 16384;

struct BridgeConfig {
    double sampleRate{kDefaultSampleRate};
    uint32_t channelCount{kDefaultChannelCount};
    Format::SampleFormat sampleFormat{Format::SampleFormat::kF32};
    bool nonInterleaved{false};

    uint32_t bufferCount{kDefaultBufferCount};
    uint32_t framesPerBuffer{kDefaultFramesPerBuffer};

    // Zero means RequestBuffer waits forever.
    std::chrono::milliseconds acquireTimeout{0};
};

void InitializeBridgeConfigDefaults(BridgeConfig& outConfig);

// Reads CAB_SAMPLE_RATE, CAB_CHANNELS, CAB_SAMPLE_FORMAT (f32/f64/i32/i16/i8),
// CAB_NON_INTERLEAVED, CAB_BUFFER_COUNT, CAB_FRAMES_PER_BUFFER and
// CAB_ACQUIRE_TIMEOUT_MS. Absent or malformed keys leave the field untouched.
void ParseBridgeConfigFromProperties(const PropertyLookup& lookup, BridgeConfig& inOutConfig);

// Zero values fall back to defaults; oversized values clamp to the max.
void ClampBridgeConfig(BridgeConfig& inOutConfig);

[[nodiscard]] BridgeConfig LoadBridgeConfig(const PropertyLookup& lookup);

[[nodiscard]] Format::StreamFormat MakeStreamFormat(const BridgeConfig& config) noexcept;

// Samples per queue buffer: all channels of framesPerBuffer frames.
[[nodiscard]] size_t BufferCapacitySamples(const BridgeConfig& config) noexcept;

} // namespace CAB::Config
