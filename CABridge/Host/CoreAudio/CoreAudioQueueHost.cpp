#include "CoreAudioHost.hpp"

#include "../../Core/StatusCodes.hpp"
#include "../../Logging/Logging.hpp"
#include "SdkLayout.hpp"

namespace CAB::Host::CoreAudio {

struct CoreAudioQueueHost::Thunk {
    QueueOutputCallback output{nullptr};
    QueueInputCallback input{nullptr};
    void* userData{nullptr};
};

namespace {

void OutputThunk(void* userData, ::AudioQueueRef queue, ::AudioQueueBufferRef buffer) {
    auto* thunk = static_cast<CoreAudioQueueHost::Thunk*>(userData);
    thunk->output(thunk->userData, FromSdk(queue), FromSdk(buffer));
}

void InputThunk(void* userData, ::AudioQueueRef queue, ::AudioQueueBufferRef buffer,
                const ::AudioTimeStamp* startTime, UInt32 numberPackets,
                const ::AudioStreamPacketDescription* packetDescriptions) {
    auto* thunk = static_cast<CoreAudioQueueHost::Thunk*>(userData);
    thunk->input(thunk->userData, FromSdk(queue), FromSdk(buffer), FromSdk(startTime), numberPackets,
                 reinterpret_cast<const StreamPacketDescription*>(packetDescriptions));
}

const ::AudioStreamBasicDescription* ToSdk(const StreamBasicDescription& format) noexcept {
    return reinterpret_cast<const ::AudioStreamBasicDescription*>(&format);
}

} // namespace

CoreAudioQueueHost::CoreAudioQueueHost() = default;
CoreAudioQueueHost::~CoreAudioQueueHost() = default;

Status CoreAudioQueueHost::NewOutput(const StreamBasicDescription& format, QueueOutputCallback callback,
                                     void* userData, QueueRef& outQueue) noexcept {
    auto node = StageNode<ThunkMap>();
    if (node.empty()) {
        return static_cast<Status>(::CAB::AudioError::kMemFull);
    }
    Thunk* thunk = node.mapped().get();
    thunk->output = callback;
    thunk->userData = userData;

    ::AudioQueueRef queue = nullptr;
    const OSStatus status =
        AudioQueueNewOutput(ToSdk(format), &OutputThunk, thunk, nullptr, nullptr, 0, &queue);
    if (status != noErr) {
        CAB_LOG_ERROR(Host, "AudioQueueNewOutput failed status=%d", static_cast<int>(status));
        return status;
    }
    outQueue = FromSdk(queue);
    node.key() = outQueue;
    std::lock_guard lock(mutex_);
    thunks_.insert(std::move(node));
    return kNoErr;
}

Status CoreAudioQueueHost::NewInput(const StreamBasicDescription& format, QueueInputCallback callback,
                                    void* userData, QueueRef& outQueue) noexcept {
    auto node = StageNode<ThunkMap>();
    if (node.empty()) {
        return static_cast<Status>(::CAB::AudioError::kMemFull);
    }
    Thunk* thunk = node.mapped().get();
    thunk->input = callback;
    thunk->userData = userData;

    ::AudioQueueRef queue = nullptr;
    const OSStatus status =
        AudioQueueNewInput(ToSdk(format), &InputThunk, thunk, nullptr, nullptr, 0, &queue);
    if (status != noErr) {
        CAB_LOG_ERROR(Host, "AudioQueueNewInput failed status=%d", static_cast<int>(status));
        return status;
    }
    outQueue = FromSdk(queue);
    node.key() = outQueue;
    std::lock_guard lock(mutex_);
    thunks_.insert(std::move(node));
    return kNoErr;
}

Status CoreAudioQueueHost::AllocateBuffer(QueueRef queue, uint32_t byteCapacity,
                                          QueueBuffer*& outBuffer) noexcept {
    ::AudioQueueBufferRef buffer = nullptr;
    const OSStatus status = AudioQueueAllocateBuffer(ToSdk(queue), byteCapacity, &buffer);
    outBuffer = status == noErr ? FromSdk(buffer) : nullptr;
    return status;
}

Status CoreAudioQueueHost::FreeBuffer(QueueRef queue, QueueBuffer* buffer) noexcept {
    return AudioQueueFreeBuffer(ToSdk(queue), ToSdk(buffer));
}

Status CoreAudioQueueHost::EnqueueBuffer(QueueRef queue, QueueBuffer* buffer) noexcept {
    return AudioQueueEnqueueBuffer(ToSdk(queue), ToSdk(buffer), 0, nullptr);
}

Status CoreAudioQueueHost::Start(QueueRef queue) noexcept {
    return AudioQueueStart(ToSdk(queue), nullptr);
}

Status CoreAudioQueueHost::Stop(QueueRef queue, bool immediate) noexcept {
    return AudioQueueStop(ToSdk(queue), immediate);
}

Status CoreAudioQueueHost::Dispose(QueueRef queue, bool immediate) noexcept {
    const OSStatus status = AudioQueueDispose(ToSdk(queue), immediate);
    if (status != noErr) {
        return status;
    }
    std::lock_guard lock(mutex_);
    auto it = thunks_.find(queue);
    if (it != thunks_.end()) {
        // A deferred dispose can still call back; its thunk lives as long as the host.
        if (immediate) {
            thunks_.erase(it);
        } else {
            MoveNode(thunks_, it, retired_);
        }
    }
    return kNoErr;
}

} // namespace CAB::Host::CoreAudio
