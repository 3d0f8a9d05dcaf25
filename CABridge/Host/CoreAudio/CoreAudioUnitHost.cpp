#include "CoreAudioHost.hpp"

#include "../../Core/StatusCodes.hpp"
#include "../../Logging/Logging.hpp"
#include "SdkLayout.hpp"

namespace CAB::Host::CoreAudio {

struct CoreAudioUnitHost::Thunk {
    RenderCallbackStruct target{};
};

namespace {

OSStatus RenderThunk(void* refCon, ::AudioUnitRenderActionFlags* ioActionFlags,
                     const ::AudioTimeStamp* timeStamp, UInt32 busNumber, UInt32 numberFrames,
                     ::AudioBufferList* ioData) {
    auto* thunk = static_cast<CoreAudioUnitHost::Thunk*>(refCon);
    uint32_t flags = ioActionFlags ? static_cast<uint32_t>(*ioActionFlags) : 0;
    const Status status = thunk->target.inputProc(thunk->target.inputProcRefCon, &flags, FromSdk(timeStamp),
                                                  busNumber, numberFrames, FromSdk(ioData));
    if (ioActionFlags) {
        *ioActionFlags = static_cast<::AudioUnitRenderActionFlags>(flags);
    }
    return status;
}

} // namespace

CoreAudioUnitHost::CoreAudioUnitHost() = default;
CoreAudioUnitHost::~CoreAudioUnitHost() = default;

Status CoreAudioUnitHost::NewInstance(ComponentRef component, UnitRef& outUnit) noexcept {
    ::AudioComponentInstance instance = nullptr;
    const OSStatus status = AudioComponentInstanceNew(ToSdk(component), &instance);
    outUnit = status == noErr ? FromSdk(instance) : nullptr;
    return status;
}

Status CoreAudioUnitHost::DisposeInstance(UnitRef unit) noexcept {
    const OSStatus status = AudioComponentInstanceDispose(ToSdk(unit));
    if (status != noErr) {
        return status;
    }
    std::lock_guard lock(mutex_);
    thunks_.erase(unit);
    return kNoErr;
}

Status CoreAudioUnitHost::Initialize(UnitRef unit) noexcept {
    return AudioUnitInitialize(ToSdk(unit));
}

Status CoreAudioUnitHost::Uninitialize(UnitRef unit) noexcept {
    return AudioUnitUninitialize(ToSdk(unit));
}

Status CoreAudioUnitHost::OutputStart(UnitRef unit) noexcept {
    return AudioOutputUnitStart(ToSdk(unit));
}

Status CoreAudioUnitHost::OutputStop(UnitRef unit) noexcept {
    return AudioOutputUnitStop(ToSdk(unit));
}

Status CoreAudioUnitHost::SetProperty(UnitRef unit, PropertyId id, Scope scope, Element element,
                                      const void* data, uint32_t dataSize) noexcept {
    const bool isCallback = id == Property::kSetRenderCallback || id == Property::kSetInputCallback;
    if (isCallback && dataSize == sizeof(RenderCallbackStruct) && data != nullptr) {
        return InstallCallback(unit, id, scope, element, *static_cast<const RenderCallbackStruct*>(data));
    }
    return AudioUnitSetProperty(ToSdk(unit), id, static_cast<::AudioUnitScope>(scope), element, data, dataSize);
}

Status CoreAudioUnitHost::GetProperty(UnitRef unit, PropertyId id, Scope scope, Element element,
                                      void* outData, uint32_t& ioDataSize) noexcept {
    UInt32 size = ioDataSize;
    const OSStatus status =
        AudioUnitGetProperty(ToSdk(unit), id, static_cast<::AudioUnitScope>(scope), element, outData, &size);
    ioDataSize = size;
    return status;
}

Status CoreAudioUnitHost::Render(UnitRef unit, uint32_t* ioActionFlags, const AudioTimeStamp* timeStamp,
                                 uint32_t outputBus, uint32_t numberFrames, AudioBufferList* ioData) noexcept {
    ::AudioUnitRenderActionFlags flags =
        static_cast<::AudioUnitRenderActionFlags>(ioActionFlags ? *ioActionFlags : 0);
    const OSStatus status =
        AudioUnitRender(ToSdk(unit), &flags, ToSdk(timeStamp), outputBus, numberFrames, ToSdk(ioData));
    if (ioActionFlags) {
        *ioActionFlags = static_cast<uint32_t>(flags);
    }
    return status;
}

Status CoreAudioUnitHost::InstallCallback(UnitRef unit, PropertyId id, Scope scope, Element element,
                                          const RenderCallbackStruct& callback) noexcept {
    ::AURenderCallbackStruct sdk{};
    Thunk* thunk = nullptr;
    if (callback.inputProc != nullptr) {
        auto node = StageNode<ThunkMap>();
        if (node.empty()) {
            return static_cast<Status>(::CAB::AudioError::kMemFull);
        }
        node.key() = unit;
        thunk = node.mapped().get();
        thunk->target = callback;
        std::lock_guard lock(mutex_);
        // Replaced thunks stay alive until dispose; the I/O thread may still hold one.
        thunks_.insert(std::move(node));
        sdk.inputProc = &RenderThunk;
        sdk.inputProcRefCon = thunk;
    }
    const OSStatus status = AudioUnitSetProperty(ToSdk(unit), id, static_cast<::AudioUnitScope>(scope),
                                                 element, &sdk, sizeof(sdk));
    if (status != noErr) {
        CAB_LOG_ERROR(Host, "Installing callback property %u failed status=%d", id, static_cast<int>(status));
    }
    return status;
}

} // namespace CAB::Host::CoreAudio
