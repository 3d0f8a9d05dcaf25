#pragma once

#include <AudioToolbox/AudioToolbox.h>

#include <cstddef>

#include "../HostTypes.hpp"

// The host structures are declared independently of the SDK so the core
// library builds without it. Casting between the two is only valid while
// these hold.
namespace CAB::Host::CoreAudio {

#define CAB_SDK_SAME_FIELD(ours, sdk, ourField, sdkField)                 \
    static_assert(offsetof(ours, ourField) == offsetof(sdk, sdkField) &&  \
                  sizeof(ours::ourField) == sizeof(sdk::sdkField),        \
                  #ours "::" #ourField " does not match " #sdk)

static_assert(sizeof(AudioBuffer) == sizeof(::AudioBuffer));
CAB_SDK_SAME_FIELD(AudioBuffer, ::AudioBuffer, numberChannels, mNumberChannels);
CAB_SDK_SAME_FIELD(AudioBuffer, ::AudioBuffer, dataByteSize, mDataByteSize);
CAB_SDK_SAME_FIELD(AudioBuffer, ::AudioBuffer, data, mData);

static_assert(sizeof(AudioBufferList) == sizeof(::AudioBufferList));
CAB_SDK_SAME_FIELD(AudioBufferList, ::AudioBufferList, numberBuffers, mNumberBuffers);
static_assert(offsetof(AudioBufferList, buffers) == offsetof(::AudioBufferList, mBuffers));

static_assert(sizeof(SMPTETime) == sizeof(::SMPTETime));
static_assert(sizeof(AudioTimeStamp) == sizeof(::AudioTimeStamp));
CAB_SDK_SAME_FIELD(AudioTimeStamp, ::AudioTimeStamp, sampleTime, mSampleTime);
CAB_SDK_SAME_FIELD(AudioTimeStamp, ::AudioTimeStamp, hostTime, mHostTime);
CAB_SDK_SAME_FIELD(AudioTimeStamp, ::AudioTimeStamp, rateScalar, mRateScalar);
CAB_SDK_SAME_FIELD(AudioTimeStamp, ::AudioTimeStamp, wordClockTime, mWordClockTime);
CAB_SDK_SAME_FIELD(AudioTimeStamp, ::AudioTimeStamp, smpteTime, mSMPTETime);
CAB_SDK_SAME_FIELD(AudioTimeStamp, ::AudioTimeStamp, flags, mFlags);

static_assert(sizeof(StreamBasicDescription) == sizeof(::AudioStreamBasicDescription));
CAB_SDK_SAME_FIELD(StreamBasicDescription, ::AudioStreamBasicDescription, sampleRate, mSampleRate);
CAB_SDK_SAME_FIELD(StreamBasicDescription, ::AudioStreamBasicDescription, formatID, mFormatID);
CAB_SDK_SAME_FIELD(StreamBasicDescription, ::AudioStreamBasicDescription, formatFlags, mFormatFlags);
CAB_SDK_SAME_FIELD(StreamBasicDescription, ::AudioStreamBasicDescription, bytesPerPacket, mBytesPerPacket);
CAB_SDK_SAME_FIELD(StreamBasicDescription, ::AudioStreamBasicDescription, framesPerPacket, mFramesPerPacket);
CAB_SDK_SAME_FIELD(StreamBasicDescription, ::AudioStreamBasicDescription, bytesPerFrame, mBytesPerFrame);
CAB_SDK_SAME_FIELD(StreamBasicDescription, ::AudioStreamBasicDescription, channelsPerFrame, mChannelsPerFrame);
CAB_SDK_SAME_FIELD(StreamBasicDescription, ::AudioStreamBasicDescription, bitsPerChannel, mBitsPerChannel);

static_assert(sizeof(StreamPacketDescription) == sizeof(::AudioStreamPacketDescription));

static_assert(sizeof(QueueBuffer) == sizeof(::AudioQueueBuffer));
CAB_SDK_SAME_FIELD(QueueBuffer, ::AudioQueueBuffer, audioDataBytesCapacity, mAudioDataBytesCapacity);
CAB_SDK_SAME_FIELD(QueueBuffer, ::AudioQueueBuffer, audioData, mAudioData);
CAB_SDK_SAME_FIELD(QueueBuffer, ::AudioQueueBuffer, audioDataByteSize, mAudioDataByteSize);
CAB_SDK_SAME_FIELD(QueueBuffer, ::AudioQueueBuffer, userData, mUserData);
CAB_SDK_SAME_FIELD(QueueBuffer, ::AudioQueueBuffer, packetDescriptionCount, mPacketDescriptionCount);

static_assert(sizeof(ComponentDescription) == sizeof(::AudioComponentDescription));
CAB_SDK_SAME_FIELD(ComponentDescription, ::AudioComponentDescription, componentType, componentType);
CAB_SDK_SAME_FIELD(ComponentDescription, ::AudioComponentDescription, componentSubType, componentSubType);
CAB_SDK_SAME_FIELD(ComponentDescription, ::AudioComponentDescription, componentManufacturer,
                   componentManufacturer);

static_assert(Property::kStreamFormat == kAudioUnitProperty_StreamFormat);
static_assert(Property::kSetRenderCallback == kAudioUnitProperty_SetRenderCallback);
static_assert(Property::kSetInputCallback == kAudioOutputUnitProperty_SetInputCallback);
static_assert(Property::kEnableIO == kAudioOutputUnitProperty_EnableIO);
static_assert(Property::kMaximumFramesPerSlice == kAudioUnitProperty_MaximumFramesPerSlice);
static_assert(static_cast<uint32_t>(Scope::kInput) == kAudioUnitScope_Input);
static_assert(static_cast<uint32_t>(Scope::kOutput) == kAudioUnitScope_Output);

#undef CAB_SDK_SAME_FIELD

inline ::AudioQueueRef ToSdk(QueueRef queue) noexcept { return reinterpret_cast<::AudioQueueRef>(queue); }
inline QueueRef FromSdk(::AudioQueueRef queue) noexcept { return reinterpret_cast<QueueRef>(queue); }

inline ::AudioQueueBufferRef ToSdk(QueueBuffer* buffer) noexcept {
    return reinterpret_cast<::AudioQueueBufferRef>(buffer);
}
inline QueueBuffer* FromSdk(::AudioQueueBufferRef buffer) noexcept {
    return reinterpret_cast<QueueBuffer*>(buffer);
}

inline ::AudioUnit ToSdk(UnitRef unit) noexcept { return reinterpret_cast<::AudioUnit>(unit); }
inline UnitRef FromSdk(::AudioUnit unit) noexcept { return reinterpret_cast<UnitRef>(unit); }

inline ::AudioComponent ToSdk(ComponentRef component) noexcept {
    return reinterpret_cast<::AudioComponent>(component);
}
inline ComponentRef FromSdk(::AudioComponent component) noexcept {
    return reinterpret_cast<ComponentRef>(component);
}

inline const ::AudioTimeStamp* ToSdk(const AudioTimeStamp* stamp) noexcept {
    return reinterpret_cast<const ::AudioTimeStamp*>(stamp);
}
inline const AudioTimeStamp* FromSdk(const ::AudioTimeStamp* stamp) noexcept {
    return reinterpret_cast<const AudioTimeStamp*>(stamp);
}

inline ::AudioBufferList* ToSdk(AudioBufferList* list) noexcept {
    return reinterpret_cast<::AudioBufferList*>(list);
}
inline AudioBufferList* FromSdk(::AudioBufferList* list) noexcept {
    return reinterpret_cast<AudioBufferList*>(list);
}

} // namespace CAB::Host::CoreAudio
