#include <gtest/gtest.h>

#include "Config/BridgeConfig.hpp"

#include <map>
#include <string>

namespace {

using CAB::Config::BridgeConfig;
using CAB::Format::SampleFormat;

CAB::Config::PropertyLookup MapLookup(const std::map<std::string, std::string>& values) {
    return [values](const char* key) -> const char* {
        auto it = values.find(key);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

TEST(BridgeConfigTests, InitializesExpectedDefaults) {
    BridgeConfig config{};
    config.channelCount = 9;
    CAB::Config::InitializeBridgeConfigDefaults(config);

    EXPECT_DOUBLE_EQ(config.sampleRate, CAB::Config::kDefaultSampleRate);
    EXPECT_EQ(config.channelCount, CAB::Config::kDefaultChannelCount);
    EXPECT_EQ(config.sampleFormat, SampleFormat::kF32);
    EXPECT_FALSE(config.nonInterleaved);
    EXPECT_EQ(config.bufferCount, CAB::Config::kDefaultBufferCount);
    EXPECT_EQ(config.framesPerBuffer, CAB::Config::kDefaultFramesPerBuffer);
    EXPECT_EQ(config.acquireTimeout.count(), 0);
}

TEST(BridgeConfigTests, ParsesEveryKey) {
    BridgeConfig config{};
    CAB::Config::ParseBridgeConfigFromProperties(MapLookup({
        {"CAB_SAMPLE_RATE", "44100"},
        {"CAB_CHANNELS", "6"},
        {"CAB_SAMPLE_FORMAT", "i16"},
        {"CAB_NON_INTERLEAVED", "true"},
        {"CAB_BUFFER_COUNT", "8"},
        {"CAB_FRAMES_PER_BUFFER", "256"},
        {"CAB_ACQUIRE_TIMEOUT_MS", "25"},
    }), config);

    EXPECT_DOUBLE_EQ(config.sampleRate, 44100.0);
    EXPECT_EQ(config.channelCount, 6u);
    EXPECT_EQ(config.sampleFormat, SampleFormat::kI16);
    EXPECT_TRUE(config.nonInterleaved);
    EXPECT_EQ(config.bufferCount, 8u);
    EXPECT_EQ(config.framesPerBuffer, 256u);
    EXPECT_EQ(config.acquireTimeout.count(), 25);
}

TEST(BridgeConfigTests, MalformedValuesLeaveFieldsUntouched) {
    BridgeConfig config{};
    CAB::Config::ParseBridgeConfigFromProperties(MapLookup({
        {"CAB_SAMPLE_RATE", "fast"},
        {"CAB_CHANNELS", "-2"},
        {"CAB_SAMPLE_FORMAT", "f24"},
        {"CAB_NON_INTERLEAVED", "sometimes"},
        {"CAB_BUFFER_COUNT", "3x"},
    }), config);

    EXPECT_DOUBLE_EQ(config.sampleRate, CAB::Config::kDefaultSampleRate);
    EXPECT_EQ(config.channelCount, CAB::Config::kDefaultChannelCount);
    EXPECT_EQ(config.sampleFormat, SampleFormat::kF32);
    EXPECT_FALSE(config.nonInterleaved);
    EXPECT_EQ(config.bufferCount, CAB::Config::kDefaultBufferCount);
}

TEST(BridgeConfigTests, ClampFallsBackToDefaultsForZero) {
    BridgeConfig config{};
    config.sampleRate = 0.0;
    config.channelCount = 0;
    config.bufferCount = 0;
    config.framesPerBuffer = 0;

    CAB::Config::ClampBridgeConfig(config);

    EXPECT_DOUBLE_EQ(config.sampleRate, CAB::Config::kDefaultSampleRate);
    EXPECT_EQ(config.channelCount, CAB::Config::kDefaultChannelCount);
    EXPECT_EQ(config.bufferCount, CAB::Config::kDefaultBufferCount);
    EXPECT_EQ(config.framesPerBuffer, CAB::Config::kDefaultFramesPerBuffer);
}

TEST(BridgeConfigTests, ClampRespectsLimits) {
    BridgeConfig config{};
    config.sampleRate = 1'000'000.0;
    config.channelCount = 500;
    config.bufferCount = 1000;
    config.framesPerBuffer = 1u << 20;

    CAB::Config::ClampBridgeConfig(config);

    EXPECT_DOUBLE_EQ(config.sampleRate, CAB::Config::kMaxSampleRate);
    EXPECT_EQ(config.channelCount, CAB::Config::kMaxChannelCount);
    EXPECT_EQ(config.bufferCount, CAB::Config::kMaxBufferCount);
    EXPECT_EQ(config.framesPerBuffer, CAB::Config::kMaxFramesPerBuffer);

    config.sampleRate = 100.0;
    CAB::Config::ClampBridgeConfig(config);
    EXPECT_DOUBLE_EQ(config.sampleRate, CAB::Config::kMinSampleRate);
}

TEST(BridgeConfigTests, LoadBuildsMatchingStreamFormat) {
    const auto config = CAB::Config::LoadBridgeConfig(MapLookup({
        {"CAB_CHANNELS", "4"},
        {"CAB_FRAMES_PER_BUFFER", "128"},
        {"CAB_SAMPLE_FORMAT", "i32"},
    }));

    EXPECT_EQ(CAB::Config::BufferCapacitySamples(config), 512u);

    const auto format = CAB::Config::MakeStreamFormat(config);
    EXPECT_EQ(format.Channels(), 4u);
    EXPECT_EQ(format.GetSampleFormat(), SampleFormat::kI32);
    EXPECT_TRUE(format.IsInterleaved());
    EXPECT_DOUBLE_EQ(format.SampleRate(), CAB::Config::kDefaultSampleRate);
}

TEST(PropertySourceTests, ParsesScalars) {
    EXPECT_EQ(CAB::Config::ParseUnsigned("42"), 42u);
    EXPECT_FALSE(CAB::Config::ParseUnsigned("").has_value());
    EXPECT_FALSE(CAB::Config::ParseUnsigned("4 2").has_value());
    EXPECT_DOUBLE_EQ(CAB::Config::ParseDouble("96000.5").value(), 96000.5);
    EXPECT_EQ(CAB::Config::ParseBool("on"), true);
    EXPECT_EQ(CAB::Config::ParseBool("off"), false);
    EXPECT_FALSE(CAB::Config::ParseBool("2").has_value());
}

} // namespace
