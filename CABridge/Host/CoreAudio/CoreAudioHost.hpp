#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "../IAudioQueueHost.hpp"
#include "../IAudioUnitHost.hpp"
#include "../IComponentRegistry.hpp"
#include "../ThunkNode.hpp"

// Production host services backed by AudioToolbox. Apple builds only.
namespace CAB::Host::CoreAudio {

/**
 * @brief AudioQueue services.
 *
 * The SDK callback signatures use SDK struct types, so each queue gets a
 * thunk record holding the caller's callback and context. The record outlives
 * every callback because it is destroyed only after AudioQueueDispose returns.
 */
class CoreAudioQueueHost final : public IAudioQueueHost {
public:
    CoreAudioQueueHost();
    ~CoreAudioQueueHost() override;

    CoreAudioQueueHost(const CoreAudioQueueHost&) = delete;
    CoreAudioQueueHost& operator=(const CoreAudioQueueHost&) = delete;

    Status NewOutput(const StreamBasicDescription& format, QueueOutputCallback callback,
                     void* userData, QueueRef& outQueue) noexcept override;
    Status NewInput(const StreamBasicDescription& format, QueueInputCallback callback,
                    void* userData, QueueRef& outQueue) noexcept override;
    Status AllocateBuffer(QueueRef queue, uint32_t byteCapacity, QueueBuffer*& outBuffer) noexcept override;
    Status FreeBuffer(QueueRef queue, QueueBuffer* buffer) noexcept override;
    Status EnqueueBuffer(QueueRef queue, QueueBuffer* buffer) noexcept override;
    Status Start(QueueRef queue) noexcept override;
    Status Stop(QueueRef queue, bool immediate) noexcept override;
    Status Dispose(QueueRef queue, bool immediate) noexcept override;

    struct Thunk;

private:
    using ThunkMap = std::map<QueueRef, std::unique_ptr<Thunk>>;

    std::mutex mutex_;
    ThunkMap thunks_;
    std::multimap<QueueRef, std::unique_ptr<Thunk>> retired_;
};

/**
 * @brief AudioUnit services.
 *
 * kSetRenderCallback and kSetInputCallback payloads are rewritten to point at
 * a per-unit thunk that forwards to the caller's RenderCallbackStruct.
 */
class CoreAudioUnitHost final : public IAudioUnitHost {
public:
    CoreAudioUnitHost();
    ~CoreAudioUnitHost() override;

    CoreAudioUnitHost(const CoreAudioUnitHost&) = delete;
    CoreAudioUnitHost& operator=(const CoreAudioUnitHost&) = delete;

    Status NewInstance(ComponentRef component, UnitRef& outUnit) noexcept override;
    Status DisposeInstance(UnitRef unit) noexcept override;
    Status Initialize(UnitRef unit) noexcept override;
    Status Uninitialize(UnitRef unit) noexcept override;
    Status OutputStart(UnitRef unit) noexcept override;
    Status OutputStop(UnitRef unit) noexcept override;
    Status SetProperty(UnitRef unit, PropertyId id, Scope scope, Element element,
                       const void* data, uint32_t dataSize) noexcept override;
    Status GetProperty(UnitRef unit, PropertyId id, Scope scope, Element element,
                       void* outData, uint32_t& ioDataSize) noexcept override;
    Status Render(UnitRef unit, uint32_t* ioActionFlags, const AudioTimeStamp* timeStamp,
                  uint32_t outputBus, uint32_t numberFrames, AudioBufferList* ioData) noexcept override;

    struct Thunk;

private:
    Status InstallCallback(UnitRef unit, PropertyId id, Scope scope, Element element,
                           const RenderCallbackStruct& callback) noexcept;

    using ThunkMap = std::multimap<UnitRef, std::unique_ptr<Thunk>>;

    std::mutex mutex_;
    ThunkMap thunks_;
};

// AudioComponentFindNext and friends.
class CoreAudioComponentRegistry final : public IComponentRegistry {
public:
    ComponentRef FindNext(ComponentRef previous, const ComponentDescription& search) noexcept override;
    Status CopyName(ComponentRef component, std::string& outName) override;
    Status GetVersion(ComponentRef component, uint32_t& outVersion) noexcept override;
    Status GetDescription(ComponentRef component, ComponentDescription& outDescription) noexcept override;
};

} // namespace CAB::Host::CoreAudio
