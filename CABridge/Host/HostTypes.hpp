#pragma once

#include <cstddef>
#include <cstdint>

// Binary structures shared with the host audio subsystem. Field order, widths
// and padding mirror the CoreAudio SDK declarations; the CoreAudio backend
// static_asserts the correspondence before casting between the two.
namespace CAB::Host {

using Status = int32_t;
inline constexpr Status kNoErr = 0;

struct AudioBuffer {
    uint32_t numberChannels;
    uint32_t dataByteSize;
    void* data;
};

// Variable-length: the host allocates numberBuffers descriptors contiguously
// starting at buffers[0]. Only the first slot is declared.
struct AudioBufferList {
    uint32_t numberBuffers;
    AudioBuffer buffers[1];
};

struct SMPTETime {
    int16_t subframes;
    int16_t subframeDivisor;
    uint32_t counter;
    uint32_t type;
    uint32_t flags;
    int16_t hours;
    int16_t minutes;
    int16_t seconds;
    int16_t frames;
};

enum TimeStampFlags : uint32_t {
    kSampleTimeValid = 1u << 0,
    kHostTimeValid = 1u << 1,
    kRateScalarValid = 1u << 2,
    kWordClockTimeValid = 1u << 3,
    kSMPTETimeValid = 1u << 4,
};

struct AudioTimeStamp {
    double sampleTime;
    uint64_t hostTime;
    double rateScalar;
    uint64_t wordClockTime;
    SMPTETime smpteTime;
    uint32_t flags;
    uint32_t reserved;
};

struct StreamBasicDescription {
    double sampleRate;
    uint32_t formatID;
    uint32_t formatFlags;
    uint32_t bytesPerPacket;
    uint32_t framesPerPacket;
    uint32_t bytesPerFrame;
    uint32_t channelsPerFrame;
    uint32_t bitsPerChannel;
    uint32_t reserved;
};

struct StreamPacketDescription {
    int64_t startOffset;
    uint32_t variableFramesInPacket;
    uint32_t dataByteSize;
};

struct QueueBuffer {
    uint32_t audioDataBytesCapacity;
    void* audioData;
    uint32_t audioDataByteSize;
    void* userData;
    uint32_t packetDescriptionCapacity;
    StreamPacketDescription* packetDescriptions;
    uint32_t packetDescriptionCount;
};

struct ComponentDescription {
    uint32_t componentType;
    uint32_t componentSubType;
    uint32_t componentManufacturer;
    uint32_t componentFlags;
    uint32_t componentFlagsMask;
};

// Opaque host handles.
struct OpaqueQueue;
struct OpaqueUnit;
struct OpaqueComponent;
using QueueRef = OpaqueQueue*;
using UnitRef = OpaqueUnit*;
using ComponentRef = OpaqueComponent*;

// Raw callback entry points. The opaque context token is always the first argument.
using QueueOutputCallback = void (*)(void* userData, QueueRef queue, QueueBuffer* buffer);
using QueueInputCallback = void (*)(void* userData, QueueRef queue, QueueBuffer* buffer,
                                    const AudioTimeStamp* startTime, uint32_t numberPackets,
                                    const StreamPacketDescription* packetDescriptions);
using RenderCallback = Status (*)(void* refCon, uint32_t* ioActionFlags,
                                  const AudioTimeStamp* timeStamp, uint32_t busNumber,
                                  uint32_t numberFrames, AudioBufferList* ioData);

struct RenderCallbackStruct {
    RenderCallback inputProc;
    void* inputProcRefCon;
};

// Property scopes are opaque enumerants passed through to the host.
enum class Scope : uint32_t {
    kGlobal = 0,
    kInput = 1,
    kOutput = 2,
    kGroup = 3,
    kPart = 4,
    kNote = 5,
    kLayer = 6,
    kLayerItem = 7,
};

using Element = uint32_t;
using PropertyId = uint32_t;

namespace Property {
inline constexpr PropertyId kClassInfo = 0;
inline constexpr PropertyId kSampleRate = 2;
inline constexpr PropertyId kStreamFormat = 8;
inline constexpr PropertyId kMaximumFramesPerSlice = 14;
inline constexpr PropertyId kSetRenderCallback = 23;
inline constexpr PropertyId kEnableIO = 2003;
inline constexpr PropertyId kSetInputCallback = 2005;
} // namespace Property

} // namespace CAB::Host
