#include "UnitLifecycle.hpp"

namespace CAB::Unit {

Result<std::unique_ptr<UnitLifecycle>> UnitLifecycle::Create(Host::IAudioUnitHost& host,
                                                             Host::ComponentRef component) {
    if (component == nullptr) {
        return CAB_ERROR_COMPONENT(ComponentError::kNoComponentFound, "Null component");
    }
    Host::UnitRef unit = nullptr;
    const Host::Status status = host.NewInstance(component, unit);
    if (status != Host::kNoErr) {
        return CAB_ERROR_STATUS(status, "AudioComponentInstanceNew failed");
    }
    CAB_LOG_V2(Unit, "Unit instance created unit=%p", unit);
    return std::unique_ptr<UnitLifecycle>(new UnitLifecycle(host, unit));
}

Result<std::unique_ptr<UnitLifecycle>> UnitLifecycle::Create(Host::IAudioUnitHost& host,
                                                             Host::IComponentRegistry& registry,
                                                             const Description& description) {
    Host::ComponentRef component = CAB_TRY(FindComponent(registry, description));
    return Create(host, component);
}

UnitLifecycle::UnitLifecycle(Host::IAudioUnitHost& host, Host::UnitRef unit)
    : host_(host), unit_(unit) {}

UnitLifecycle::~UnitLifecycle() {
    if (state_.IsStarted()) {
        const Host::Status status = host_.OutputStop(unit_);
        if (status != Host::kNoErr) {
            CAB_LOG_ERROR(Unit, "AudioOutputUnitStop during teardown failed status=%d (%{public}s)",
                          status, DescribeStatus(status));
        }
    }
    if (state_.IsInitialized()) {
        const Host::Status status = host_.Uninitialize(unit_);
        if (status != Host::kNoErr) {
            CAB_LOG_ERROR(Unit, "AudioUnitUninitialize during teardown failed status=%d (%{public}s)",
                          status, DescribeStatus(status));
        }
    }
    const Host::Status status = host_.DisposeInstance(unit_);
    if (status != Host::kNoErr) {
        CAB_LOG_ERROR(Unit, "AudioComponentInstanceDispose failed status=%d (%{public}s)",
                      status, DescribeStatus(status));
    }
    CAB_LOG_V2(Unit, "Unit %p: %{public}s -> Disposed", unit_, ToString(state_.CurrentState()).data());
    state_.MarkDisposed();
    renderBridge_.Release();
}

Result<void> UnitLifecycle::Initialize() {
    if (state_.IsInitialized()) {
        return {};
    }
    CAB_TRY(ToResult(host_.Initialize(unit_), "AudioUnitInitialize failed"));
    Transition(UnitState::kInitialized, "initialize");
    return {};
}

Result<void> UnitLifecycle::Start() {
    if (state_.IsStarted()) {
        return {};
    }
    CAB_TRY(Initialize());
    CAB_TRY(ToResult(host_.OutputStart(unit_), "AudioOutputUnitStart failed"));
    Transition(UnitState::kStarted, "start");
    return {};
}

Result<void> UnitLifecycle::Stop() {
    if (!state_.IsStarted()) {
        return {};
    }
    CAB_TRY(ToResult(host_.OutputStop(unit_), "AudioOutputUnitStop failed"));
    Transition(UnitState::kInitialized, "stop");
    return {};
}

Result<void> UnitLifecycle::Uninitialize() {
    CAB_TRY(Stop());
    if (!state_.IsInitialized()) {
        return {};
    }
    CAB_TRY(ToResult(host_.Uninitialize(unit_), "AudioUnitUninitialize failed"));
    Transition(UnitState::kCreated, "uninitialize");
    return {};
}

Result<void> UnitLifecycle::SetStreamFormat(const Format::StreamFormat& format,
                                            Host::Scope scope, Host::Element element) {
    const auto description = format.ToDescription();
    return SetProperty(Host::Property::kStreamFormat, scope, element, description);
}

Result<Format::StreamFormat> UnitLifecycle::GetStreamFormat(Host::Scope scope,
                                                            Host::Element element) const {
    const auto description =
        CAB_TRY(GetProperty<Host::StreamBasicDescription>(Host::Property::kStreamFormat, scope, element));
    return Format::StreamFormat::FromDescription(description);
}

Result<void> UnitLifecycle::RequireNotStarted(const char* operation) const {
    if (state_.IsStarted()) {
        CAB_LOG_V1(Unit, "%{public}s rejected while started", operation);
        return CAB_ERROR_CODE(AudioUnitError::kCannotDoInCurrentContext,
                              "Property changes are not allowed while the unit is started");
    }
    return {};
}

Result<void> UnitLifecycle::InstallRenderCallback(void* token, Host::Scope scope, Host::Element element) {
    const Host::RenderCallbackStruct callback{&RenderBridge::Trampoline, token};
    return SetPropertyRaw(Host::Property::kSetRenderCallback, scope, element, &callback,
                          static_cast<uint32_t>(sizeof(callback)));
}

Result<void> UnitLifecycle::SetPropertyRaw(Host::PropertyId id, Host::Scope scope, Host::Element element,
                                           const void* data, uint32_t size) {
    CAB_TRY(RequireNotStarted("SetProperty"));
    const Host::Status status = host_.SetProperty(unit_, id, scope, element, data, size);
    if (status != Host::kNoErr) {
        CAB_LOG_V1(Unit, "AudioUnitSetProperty id=%u scope=%u element=%u failed status=%d",
                   id, static_cast<uint32_t>(scope), element, status);
        return CAB_ERROR_STATUS(status, "AudioUnitSetProperty failed");
    }
    return {};
}

Result<void> UnitLifecycle::GetPropertyRaw(Host::PropertyId id, Host::Scope scope, Host::Element element,
                                           void* data, uint32_t size) const {
    uint32_t ioSize = size;
    const Host::Status status = host_.GetProperty(unit_, id, scope, element, data, ioSize);
    if (status != Host::kNoErr) {
        return CAB_ERROR_STATUS(status, "AudioUnitGetProperty failed");
    }
    if (ioSize != size) {
        return CAB_ERROR_CODE(AudioUnitError::kInvalidPropertyValue,
                              "AudioUnitGetProperty returned an unexpected size");
    }
    return {};
}

void UnitLifecycle::Transition(UnitState next, std::string_view reason) {
    CAB_LOG_V2(Unit, "Unit %p: %{public}s -> %{public}s (%{public}s)", unit_,
               ToString(state_.CurrentState()).data(), ToString(next).data(), reason.data());
    state_.TransitionTo(next, reason, LogDetail::NowNs());
}

} // namespace CAB::Unit
