#include "BridgeConfig.hpp"

#include "../Logging/Logging.hpp"

#include <algorithm>

namespace CAB::Config {
namespace {

template <typename T>
void ReadUnsigned(const PropertyLookup& lookup, const char* key, T& inOutValue) {
    const char* raw = lookup(key);
    if (raw == nullptr) return;
    if (auto parsed = ParseUnsigned(raw)) {
        inOutValue = static_cast<T>(std::min<uint64_t>(*parsed, UINT32_MAX));
    } else {
        CAB_LOG_V1(Host, "Ignoring malformed %{public}s=%{public}s", key, raw);
    }
}

} // namespace

void InitializeBridgeConfigDefaults(BridgeConfig& outConfig) {
    outConfig = BridgeConfig{};
}

void ParseBridgeConfigFromProperties(const PropertyLookup& lookup, BridgeConfig& inOutConfig) {
    if (!lookup) {
        return;
    }

    if (const char* rate = lookup("CAB_SAMPLE_RATE")) {
        if (auto parsed = ParseDouble(rate)) {
            inOutConfig.sampleRate = *parsed;
        } else {
            CAB_LOG_V1(Host, "Ignoring malformed CAB_SAMPLE_RATE=%{public}s", rate);
        }
    }

    ReadUnsigned(lookup, "CAB_CHANNELS", inOutConfig.channelCount);

    if (const char* format = lookup("CAB_SAMPLE_FORMAT")) {
        if (auto parsed = Format::ParseSampleFormat(format)) {
            inOutConfig.sampleFormat = *parsed;
        } else {
            CAB_LOG_V1(Host, "Ignoring unknown CAB_SAMPLE_FORMAT=%{public}s", format);
        }
    }

    if (const char* nonInterleaved = lookup("CAB_NON_INTERLEAVED")) {
        inOutConfig.nonInterleaved = ParseBool(nonInterleaved).value_or(inOutConfig.nonInterleaved);
    }

    ReadUnsigned(lookup, "CAB_BUFFER_COUNT", inOutConfig.bufferCount);
    ReadUnsigned(lookup, "CAB_FRAMES_PER_BUFFER", inOutConfig.framesPerBuffer);

    if (const char* timeout = lookup("CAB_ACQUIRE_TIMEOUT_MS")) {
        if (auto parsed = ParseUnsigned(timeout)) {
            inOutConfig.acquireTimeout = std::chrono::milliseconds(*parsed);
        }
    }
}

void ClampBridgeConfig(BridgeConfig& inOutConfig) {
    if (!(inOutConfig.sampleRate > 0.0)) {
        inOutConfig.sampleRate = kDefaultSampleRate;
    }
    inOutConfig.sampleRate = std::clamp(inOutConfig.sampleRate, kMinSampleRate, kMaxSampleRate);

    if (inOutConfig.channelCount == 0) {
        inOutConfig.channelCount = kDefaultChannelCount;
    }
    inOutConfig.channelCount = std::min(inOutConfig.channelCount, kMaxChannelCount);

    if (inOutConfig.bufferCount == 0) {
        inOutConfig.bufferCount = kDefaultBufferCount;
    }
    inOutConfig.bufferCount = std::min(inOutConfig.bufferCount, kMaxBufferCount);

    if (inOutConfig.framesPerBuffer == 0) {
        inOutConfig.framesPerBuffer = kDefaultFramesPerBuffer;
    }
    inOutConfig.framesPerBuffer = std::min(inOutConfig.framesPerBuffer, kMaxFramesPerBuffer);
}

BridgeConfig LoadBridgeConfig(const PropertyLookup& lookup) {
    BridgeConfig config;
    InitializeBridgeConfigDefaults(config);
    ParseBridgeConfigFromProperties(lookup, config);
    ClampBridgeConfig(config);
    CAB_LOG_V2(Host, "BridgeConfig: rate=%.0f ch=%u fmt=%{public}s nonInterleaved=%d buffers=%u frames=%u timeoutMs=%lld",
               config.sampleRate, config.channelCount, Format::ToString(config.sampleFormat).data(),
               config.nonInterleaved, config.bufferCount, config.framesPerBuffer,
               static_cast<long long>(config.acquireTimeout.count()));
    return config;
}

Format::StreamFormat MakeStreamFormat(const BridgeConfig& config) noexcept {
    const auto flags = config.nonInterleaved ? Format::LinearPcmFlags::kIsNonInterleaved
                                             : Format::LinearPcmFlags::kNone;
    return Format::StreamFormat(config.sampleRate, config.sampleFormat, flags, config.channelCount);
}

size_t BufferCapacitySamples(const BridgeConfig& config) noexcept {
    return static_cast<size_t>(config.framesPerBuffer) * config.channelCount;
}

} // namespace CAB::Config
